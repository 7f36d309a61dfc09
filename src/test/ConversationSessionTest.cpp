#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include "state_machine.hpp"

using namespace std::chrono_literals;

namespace {

const std::vector<std::string> CATALOG = {"manga", "queijo"};

class FailingStore : public InMemoryOrderStore {
public:
    void persist(const std::string&, const std::string&, const OrderLines&, OrderStatus, const std::string&) override {
        throw std::runtime_error("storage offline");
    }
};

struct Fixture {
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<InMemoryOrderStore> store = std::make_shared<InMemoryOrderStore>();
    std::shared_ptr<ConversationSession> session;

    explicit Fixture(SessionSettings settings = {}) {
        session = std::make_shared<ConversationSession>("s1", "u1", CATALOG, scheduler, store, settings);
    }

    std::vector<std::string> drain() {
        std::vector<std::string> out;
        while (auto msg = session->fetch_pending()) out.push_back(*msg);
        return out;
    }

    void start_collecting() {
        session->process_message("oi");
        session->process_message("1");
        assert(session->state() == ConversationState::COLLECTING);
    }
};

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

void test_menu() {
    Fixture f;
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);

    auto r = f.session->process_message("olá");
    assert(r.accepted && r.message && contains(*r.message, "pedir(1)"));
    assert(f.session->state() == ConversationState::OPTION);

    r = f.session->process_message("3");
    assert(!r.accepted && "Unknown option should be rejected.");
    assert(f.session->state() == ConversationState::OPTION);

    r = f.session->process_message("2");
    assert(r.accepted && *r.message == "Ok então.");
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.scheduler->pending() == 0);
}

void test_explicit_confirmation() {
    Fixture f;
    f.start_collecting();

    auto r = f.session->process_message("pronto");
    assert(!r.accepted && "Empty list cannot be summarized.");
    assert(f.session->state() == ConversationState::COLLECTING);

    r = f.session->process_message("xyz");
    assert(!r.accepted && r.message && contains(*r.message, "Nenhum item"));

    r = f.session->process_message("2 mangas e 3 queijos");
    assert(r.accepted && !r.message);
    OrderLines current = f.session->get_current_orders();
    assert(current.size() == 2 && current["manga"] == 2 && current["queijo"] == 3);

    r = f.session->process_message("pronto");
    assert(r.accepted && contains(*r.message, "Preparando"));
    assert(f.session->state() == ConversationState::CONFIRMING);
    auto queued = f.drain();
    assert(queued.size() == 1 && contains(queued[0], "RESUMO") && contains(queued[0], "manga: 2"));

    r = f.session->process_message("Sim");
    assert(r.accepted && contains(*r.message, "CONFIRMADO COM SUCESSO"));
    assert(contains(*r.message, "2x manga") && contains(*r.message, "3x queijo"));
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->get_current_orders().empty());
    assert(f.session->get_confirmed_orders().size() == 1);
    assert(f.scheduler->pending() == 0 && "Confirming leaves no timer behind.");

    auto rows = f.store->rows();
    assert(rows.size() == 2);
    for (const auto& row : rows) {
        assert(row.status == OrderStatus::CONFIRMED && row.group == MAIN_GROUP);
        assert(row.user_id == "u1" && row.session_id == "s1");
    }
    assert(f.store->global_orders("u1").main_orders.at("queijo") == 3);
}

void test_reminders_and_auto_confirm() {
    Fixture f;
    f.start_collecting();
    f.session->process_message("2 mangas");

    f.scheduler->advance(4999ms);
    assert(f.session->state() == ConversationState::COLLECTING);

    f.scheduler->advance(1ms);
    assert(f.session->state() == ConversationState::CONFIRMING);
    assert(f.session->reminder_count() == 1);
    assert(f.drain().size() == 1);

    for (int n = 1; n <= 4; ++n) {
        f.scheduler->advance(5000ms);
        auto queued = f.drain();
        assert(queued.size() == 1);
        assert(contains(queued[0], "LEMBRETE (" + std::to_string(n) + "/5)"));
        assert(f.session->state() == ConversationState::CONFIRMING);
    }

    f.scheduler->advance(5000ms);
    auto queued = f.drain();
    assert(queued.size() == 2 && "Last reminder is followed by the auto-confirm notice.");
    assert(contains(queued[0], "LEMBRETE (5/5)"));
    assert(contains(queued[1], "CONFIRMADO AUTOMATICAMENTE"));
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.session->get_current_orders().empty());
    assert(f.scheduler->pending() == 0);

    auto rows = f.store->rows();
    assert(rows.size() == 1);
    assert(rows[0].status == OrderStatus::AUTO_CONFIRMED);
    assert(rows[0].group.rfind("auto_", 0) == 0);
    assert(rows[0].product == "manga" && rows[0].quantity == 2);

    GlobalOrders global = f.store->global_orders("u1");
    assert(global.main_orders.empty());
    assert(global.auto_orders.size() == 1);

    f.store->promote_group("u1", rows[0].group);
    global = f.store->global_orders("u1");
    assert(global.auto_orders.empty() && global.main_orders.at("manga") == 2);
}

void test_activity_resets_inactivity_timer() {
    Fixture f;
    f.start_collecting();

    f.scheduler->advance(5000ms);
    assert(f.session->state() == ConversationState::COLLECTING && "Empty list never goes to summary.");
    assert(f.drain().empty());
    assert(f.scheduler->pending() == 1);

    f.session->process_message("1 queijo");
    f.scheduler->advance(3000ms);
    f.session->process_message("1 manga");
    f.scheduler->advance(3000ms);
    assert(f.session->state() == ConversationState::COLLECTING);
    f.scheduler->advance(2000ms);
    assert(f.session->state() == ConversationState::CONFIRMING);
}

void test_confirming_replies() {
    Fixture f;
    f.start_collecting();
    f.session->process_message("2 mangas");
    f.scheduler->advance(5000ms);
    f.scheduler->advance(5000ms);
    assert(f.session->reminder_count() == 2);

    auto r = f.session->process_message("xyz");
    assert(!r.accepted);
    assert(f.session->state() == ConversationState::CONFIRMING);

    r = f.session->process_message("mais 1 queijo");
    assert(r.accepted);
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->reminder_count() == 0);
    OrderLines current = f.session->get_current_orders();
    assert(current["manga"] == 2 && current["queijo"] == 1);

    f.scheduler->advance(5000ms);
    assert(f.session->state() == ConversationState::CONFIRMING);

    r = f.session->process_message("não");
    assert(r.accepted && contains(*r.message, "Lista limpa"));
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->get_current_orders().empty());
    assert(f.scheduler->pending() == 1);
    assert(f.store->rows().empty());
}

void test_cancel_from_every_state() {
    Fixture f;
    auto r = f.session->process_message("cancelar");
    assert(r.accepted && !r.message);
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);

    f.session->process_message("oi");
    f.session->process_message("hoje não");
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);

    f.start_collecting();
    f.session->process_message("2 mangas");
    f.session->process_message("quero cancelar");
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.session->get_current_orders().empty());
    assert(f.scheduler->pending() == 0);

    f.start_collecting();
    f.session->process_message("2 mangas");
    f.scheduler->advance(5000ms);
    assert(f.session->state() == ConversationState::CONFIRMING);
    f.session->process_message("CANCELAR");
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.scheduler->pending() == 0);
    f.scheduler->advance(60000ms);
    assert(f.store->rows().empty() && "Cancelled order is never saved.");
}

void test_hold_pending_mode() {
    SessionSettings settings;
    settings.auto_confirm_mode = AutoConfirmMode::HOLD_PENDING;
    settings.max_reminders = 2;
    settings.reminder_interval = 1000ms;
    Fixture f(settings);
    f.start_collecting();
    f.session->process_message("3 queijos");

    f.scheduler->advance(5000ms);
    f.scheduler->advance(1000ms);
    f.scheduler->advance(1000ms);
    assert(f.session->state() == ConversationState::PENDING_CONFIRMATION);
    assert(f.session->get_pending_orders().size() == 1);
    assert(f.session->get_current_orders().empty());
    assert(f.drain().size() == 4);
    assert(f.store->rows().empty());

    auto r = f.session->process_message("confirmar");
    assert(r.accepted && contains(*r.message, "1 pedido(s)"));
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->get_pending_orders().empty());
    assert(f.session->get_confirmed_orders().size() == 1);
    assert(f.store->rows().size() == 1 && f.store->rows()[0].status == OrderStatus::CONFIRMED);

    // Pending order turned down
    f.session->process_message("1 manga");
    f.scheduler->advance(7000ms);
    assert(f.session->state() == ConversationState::PENDING_CONFIRMATION);
    r = f.session->process_message("n");
    assert(r.accepted);
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->get_pending_orders().empty());
    assert(f.session->get_confirmed_orders().size() == 1);
}

SessionSettings hold_after_one_reminder() {
    SessionSettings settings;
    settings.auto_confirm_mode = AutoConfirmMode::HOLD_PENDING;
    settings.max_reminders = 1;
    settings.reminder_interval = 1000ms;
    return settings;
}

void test_cancel_drops_pending_orders() {
    Fixture f(hold_after_one_reminder());
    f.start_collecting();
    f.session->process_message("2 mangas");
    f.scheduler->advance(6000ms);
    assert(f.session->state() == ConversationState::PENDING_CONFIRMATION);
    assert(f.session->get_pending_orders().size() == 1);

    f.session->process_message("cancelar");
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.session->get_pending_orders().empty() && "Cancel should discard parked orders.");

    f.start_collecting();
    f.session->process_message("3 queijos");
    f.scheduler->advance(6000ms);
    assert(f.session->state() == ConversationState::PENDING_CONFIRMATION);
    assert(f.session->get_pending_orders().size() == 1);

    auto r = f.session->process_message("sim");
    assert(r.accepted && contains(*r.message, "1 pedido(s)"));
    auto rows = f.store->rows();
    assert(rows.size() == 1);
    assert(rows[0].product == "queijo" && rows[0].quantity == 3);

    // restart() discards parked orders as well
    f.session->process_message("1 manga");
    f.scheduler->advance(6000ms);
    assert(f.session->get_pending_orders().size() == 1);
    f.session->restart();
    assert(f.session->get_pending_orders().empty());
    assert(f.session->get_confirmed_orders().size() == 1);
    assert(f.store->rows().size() == 1);
}

void test_empty_confirmation_keeps_history() {
    Fixture f;
    f.start_collecting();
    f.session->process_message("2 mangas");
    f.session->process_message("pronto");
    f.session->process_message("sim");
    assert(f.session->get_confirmed_orders().size() == 1);
    assert(f.session->state() == ConversationState::COLLECTING);

    auto r = f.session->process_message("confirmar");
    assert(!r.accepted && contains(*r.message, "Lista vazia"));
    assert(f.session->state() == ConversationState::COLLECTING);
    assert(f.session->get_confirmed_orders().size() == 1 && "History survives an empty confirmation.");

    r = f.session->process_message("pronto");
    assert(!r.accepted);
    assert(f.session->get_confirmed_orders().size() == 1);

    f.session->process_message("cancelar");
    assert(f.session->get_confirmed_orders().size() == 1);
    assert(f.store->rows().size() == 1);
}

void test_store_failure_does_not_break_the_flow() {
    auto scheduler = std::make_shared<ManualScheduler>();
    auto session = std::make_shared<ConversationSession>("s2", "u2", CATALOG, scheduler,
                                                         std::make_shared<FailingStore>());
    session->process_message("oi");
    session->process_message("1");
    session->process_message("2 mangas");
    session->process_message("pronto");
    auto r = session->process_message("confirmar");
    assert(r.accepted);
    assert(session->get_confirmed_orders().size() == 1);
    assert(session->state() == ConversationState::COLLECTING);
}

void test_restart_and_lifetime() {
    Fixture f;
    f.start_collecting();
    f.session->process_message("2 mangas");
    f.session->restart();
    assert(f.session->state() == ConversationState::WAITING_FOR_NEXT);
    assert(f.session->get_current_orders().empty());
    assert(f.drain().size() == 1);

    f.start_collecting();
    f.session->process_message("2 mangas");
    std::weak_ptr<ConversationSession> weak = f.session;
    f.session.reset();
    assert(weak.expired());
    f.scheduler->advance(60000ms);
    assert(f.store->rows().empty());
}

}

int main() {
    std::cout << "[Test] Starting ConversationSession Test..." << std::endl;
    test_menu();
    test_explicit_confirmation();
    test_reminders_and_auto_confirm();
    test_activity_resets_inactivity_timer();
    test_confirming_replies();
    test_cancel_from_every_state();
    test_hold_pending_mode();
    test_cancel_drops_pending_orders();
    test_empty_confirmation_keeps_history();
    test_store_failure_does_not_break_the_flow();
    test_restart_and_lifetime();
    std::cout << "[PASS] ConversationSession Test." << std::endl;
    return 0;
}
