#include "state_machine.hpp"
#include "ids.hpp"
#include "text_normalizer.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

const char* MENU_PROMPT = "🔄 **Conversa reiniciada!**\n\nVocê quer pedir(1) ou falar com o gerente(2)?";
const char* NOTHING_RECOGNIZED = "❌ Nenhum item reconhecido. Tente usar termos como '2 mangas', 'cinco queijos', etc.";

bool contains_any(const std::vector<std::string>& words, std::initializer_list<const char*> wanted) {
    for (const char* w : wanted) {
        if (std::find(words.begin(), words.end(), w) != words.end()) return true;
    }
    return false;
}

bool is_cancel_command(const std::string& command) {
    return command.find("cancelar") != std::string::npos || command.find("hoje nao") != std::string::npos;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

}

std::string to_string(ConversationState state) {
    switch (state) {
        case ConversationState::WAITING_FOR_NEXT: return "waiting_for_next";
        case ConversationState::OPTION: return "option";
        case ConversationState::COLLECTING: return "collecting";
        case ConversationState::CONFIRMING: return "confirming";
        case ConversationState::PENDING_CONFIRMATION: return "pending_confirmation";
    }
    return "unknown";
}

ConversationSession::ConversationSession(std::string session_id,
                                         std::string user_id,
                                         std::vector<std::string> product_names,
                                         std::shared_ptr<Scheduler> scheduler,
                                         std::shared_ptr<OrderStore> store,
                                         SessionSettings settings)
    : session_id(std::move(session_id)),
      user_id(std::move(user_id)),
      product_names(std::move(product_names)),
      scheduler(std::move(scheduler)),
      store(std::move(store)),
      settings(settings),
      extractor(settings.extractor),
      working(std::make_shared<const WorkingCatalog>(make_working_catalog(this->product_names))) {}

ConversationSession::~ConversationSession() {
    timer.cancel();
}

MessageResult ConversationSession::process_message(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex);

    const std::string command = normalize(text);
    const std::vector<std::string> words = split_words(command);
    std::cout << "[DEBUG] Session " << session_id << " | State: " << to_string(current_state)
              << " | Input: " << text << std::endl;

    if (is_cancel_command(command)) {
        reset_current();
        pending_orders.clear();
        current_state = ConversationState::WAITING_FOR_NEXT;
        return {true, std::nullopt};
    }

    switch (current_state) {
        case ConversationState::WAITING_FOR_NEXT:
            current_state = ConversationState::OPTION;
            return {true, MENU_PROMPT};
        case ConversationState::OPTION:
            return handle_option(command);
        case ConversationState::COLLECTING:
            return handle_collecting(text, command);
        case ConversationState::CONFIRMING:
            return handle_confirming(text, words);
        case ConversationState::PENDING_CONFIRMATION:
            return handle_pending(text, words);
    }
    return {false, "Estado não reconhecido. Digite 'cancelar' para reiniciar."};
}

MessageResult ConversationSession::handle_option(const std::string& command) {
    if (command == "1") {
        current_state = ConversationState::COLLECTING;
        arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
        return {true, "Ótimo! Digite seus pedidos. Ex: '2 mangas e 3 queijos'"};
    }
    if (command == "2") {
        current_state = ConversationState::WAITING_FOR_NEXT;
        return {true, "Ok então."};
    }
    return {false, "Por favor, escolha uma opção: 1 para pedir ou 2 para falar com o gerente."};
}

MessageResult ConversationSession::handle_collecting(const std::string& text, const std::string& command) {
    if (command == "pronto" || command == "confirmar") {
        if (!has_items()) return {false, "❌ Lista vazia. Adicione itens primeiro."};
        send_summary();
        return {true, "📋 Preparando seu resumo..."};
    }

    auto lines = merge_order(text);
    arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
    if (lines.empty()) return {false, NOTHING_RECOGNIZED};
    return {true, std::nullopt};
}

MessageResult ConversationSession::handle_confirming(const std::string& text, const std::vector<std::string>& words) {
    if (contains_any(words, {"confirmar", "sim", "s"})) {
        if (!has_items()) return {false, "❌ Lista vazia. Adicione itens primeiro."};

        cancel_timer();
        OrderLines confirmed = to_order_lines(*working);
        confirmed_orders.push_back(confirmed);
        save_orders(confirmed, OrderStatus::CONFIRMED, MAIN_GROUP);
        reset_current();

        std::string response = "✅ **PEDIDO CONFIRMADO COM SUCESSO!**\n\n**Itens confirmados:**\n";
        for (auto const& [product, qty] : confirmed) {
            response += "• " + std::to_string(qty) + "x " + product + "\n";
        }
        response += "\nObrigado pelo pedido! 🎉";
        return {true, response};
    }

    if (contains_any(words, {"nao", "n"})) {
        reset_current();
        arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
        return {true, "🔄 **Lista limpa!** Digite novos itens."};
    }

    auto lines = merge_order(text);
    if (lines.empty()) {
        return {false, "❌ Item não reconhecido. Digite 'confirmar' para confirmar ou 'nao' para cancelar."};
    }
    current_state = ConversationState::COLLECTING;
    reminders = 0;
    arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
    return {true, std::nullopt};
}

MessageResult ConversationSession::handle_pending(const std::string& text, const std::vector<std::string>& words) {
    if (contains_any(words, {"confirmar", "sim", "s"})) {
        if (pending_orders.empty()) {
            return {false, "❌ Nenhum pedido pendente. Digite novos itens ou 'cancelar' para reiniciar."};
        }
        for (const auto& order : pending_orders) {
            confirmed_orders.push_back(order);
            save_orders(order, OrderStatus::CONFIRMED, MAIN_GROUP);
        }
        const size_t count = pending_orders.size();
        pending_orders.clear();
        current_state = ConversationState::COLLECTING;
        arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
        return {true, "✅ **PEDIDO PENDENTE CONFIRMADO!** " + std::to_string(count) +
                      " pedido(s) adicionado(s) à lista."};
    }

    if (contains_any(words, {"nao", "n"})) {
        pending_orders.clear();
        current_state = ConversationState::COLLECTING;
        arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
        return {true, "🔄 Pedidos pendentes cancelados. Continue adicionando itens."};
    }

    auto lines = merge_order(text);
    current_state = ConversationState::COLLECTING;
    arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
    if (lines.empty()) return {false, NOTHING_RECOGNIZED};
    return {true, std::nullopt};
}

std::optional<std::string> ConversationSession::fetch_pending() {
    std::lock_guard<std::mutex> lock(mutex);
    if (outgoing.empty()) return std::nullopt;
    std::string message = std::move(outgoing.front());
    outgoing.pop_front();
    return message;
}

void ConversationSession::restart() {
    std::lock_guard<std::mutex> lock(mutex);
    reset_current();
    pending_orders.clear();
    current_state = ConversationState::WAITING_FOR_NEXT;
    enqueue("🔄 **Conversa reiniciada!**");
}

OrderLines ConversationSession::get_current_orders() const {
    std::shared_ptr<const WorkingCatalog> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        snapshot = working;
    }
    return to_order_lines(*snapshot);
}

std::vector<OrderLines> ConversationSession::get_confirmed_orders() const {
    std::lock_guard<std::mutex> lock(mutex);
    return confirmed_orders;
}

std::vector<OrderLines> ConversationSession::get_pending_orders() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending_orders;
}

ConversationState ConversationSession::state() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current_state;
}

int ConversationSession::reminder_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return reminders;
}

void ConversationSession::arm_timer(TimerKind kind, std::chrono::milliseconds delay) {
    cancel_timer();
    const std::uint64_t generation = timer_generation;
    std::weak_ptr<ConversationSession> weak = weak_from_this();
    timer = scheduler->after(delay, [weak, kind, generation] {
        if (auto self = weak.lock()) self->on_timer(kind, generation);
    });
}

void ConversationSession::cancel_timer() {
    timer.cancel();
    timer = TimerHandle();
    // A callback already on its way out sees a newer generation and backs off.
    ++timer_generation;
}

void ConversationSession::on_timer(TimerKind kind, std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex);
    if (generation != timer_generation) return;
    timer = TimerHandle();

    if (kind == TimerKind::INACTIVITY) {
        send_summary();
    } else {
        send_reminder();
    }
}

void ConversationSession::send_summary() {
    if (current_state != ConversationState::COLLECTING) return;

    if (!has_items()) {
        arm_timer(TimerKind::INACTIVITY, settings.inactivity_delay);
        return;
    }
    current_state = ConversationState::CONFIRMING;
    reminders = 0;
    enqueue(build_summary());
    start_reminder_cycle();
}

void ConversationSession::start_reminder_cycle() {
    reminders = 1;
    arm_timer(TimerKind::REMINDER, settings.reminder_interval);
}

void ConversationSession::send_reminder() {
    if (current_state != ConversationState::CONFIRMING || reminders > settings.max_reminders) return;

    enqueue("🔔 **LEMBRETE (" + std::to_string(reminders) + "/" + std::to_string(settings.max_reminders) +
            "):**\n" + build_summary());

    if (reminders == settings.max_reminders) {
        auto_confirm();
    } else {
        ++reminders;
        arm_timer(TimerKind::REMINDER, settings.reminder_interval);
    }
}

void ConversationSession::auto_confirm() {
    if (!has_items()) {
        cancel_timer();
        reminders = 0;
        current_state = ConversationState::WAITING_FOR_NEXT;
        return;
    }

    OrderLines order = to_order_lines(*working);
    if (settings.auto_confirm_mode == AutoConfirmMode::HOLD_PENDING) {
        pending_orders.push_back(order);
        reset_current();
        current_state = ConversationState::PENDING_CONFIRMATION;
        enqueue("🟡 **PEDIDO PENDENTE** - Responda 'confirmar' para salvar ou 'nao' para descartar.");
        return;
    }

    const std::string group = generate_auto_group_id();
    save_orders(order, OrderStatus::AUTO_CONFIRMED, group);
    enqueue("🟡 **PEDIDO CONFIRMADO AUTOMATICAMENTE** - O pedido foi salvo e aguarda sua confirmação final na barra lateral.");
    reset_current();
    current_state = ConversationState::WAITING_FOR_NEXT;
}

std::vector<ParsedOrderLine> ConversationSession::merge_order(const std::string& text) {
    ExtractionResult result = extractor.extract(text, *working);
    if (!result.lines.empty()) {
        working = std::make_shared<const WorkingCatalog>(std::move(result.catalog));
    }
    return result.lines;
}

void ConversationSession::reset_current() {
    working = std::make_shared<const WorkingCatalog>(make_working_catalog(product_names));
    current_state = ConversationState::COLLECTING;
    reminders = 0;
    cancel_timer();
}

bool ConversationSession::has_items() const {
    return ::has_items(*working);
}

std::string ConversationSession::build_summary() const {
    std::string summary = "📋 **RESUMO DO SEU PEDIDO:**\n";
    for (const auto& entry : *working) {
        if (entry.running_quantity > 0) {
            summary += "• " + entry.name + ": " + std::to_string(entry.running_quantity) + "\n";
        }
    }
    summary += "\n⚠️ **Confirma o pedido?** (responda com 'confirmar' ou 'nao')";
    return summary;
}

void ConversationSession::enqueue(const std::string& message) {
    std::cout << ">>> Bot [" << session_id << "]: " << message << std::endl;
    outgoing.push_back(message);
}

void ConversationSession::save_orders(const OrderLines& lines, OrderStatus status, const std::string& group) {
    if (!store) return;
    try {
        store->persist(user_id, session_id, lines, status, group);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Session " << session_id << ": could not save " << to_string(status)
                  << " order (" << group << "): " << e.what() << std::endl;
    }
}
