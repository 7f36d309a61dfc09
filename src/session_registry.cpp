#include "session_registry.hpp"
#include "ids.hpp"
#include <iostream>

SessionRegistry::SessionRegistry(std::vector<std::string> product_names,
                                 std::shared_ptr<Scheduler> scheduler,
                                 std::shared_ptr<OrderStore> store,
                                 SessionSettings settings)
    : product_names(std::move(product_names)),
      scheduler(std::move(scheduler)),
      store(std::move(store)),
      settings(settings) {}

std::shared_ptr<ConversationSession> SessionRegistry::get_or_create(const std::string& session_id,
                                                                    const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex);
    const std::string id = session_id.empty() ? generate_session_id() : session_id;

    auto it = sessions.find(id);
    if (it != sessions.end()) return it->second;

    auto session = std::make_shared<ConversationSession>(id, user_id, product_names, scheduler, store, settings);
    sessions.emplace(id, session);
    std::cout << "[INFO] New session " << id << " for user " << user_id << std::endl;
    return session;
}

std::shared_ptr<ConversationSession> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(session_id);
    return it == sessions.end() ? nullptr : it->second;
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (auto const& [id, session] : sessions) ids.push_back(id);
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

MessageResult SessionRegistry::process_message(const std::string& session_id,
                                               const std::string& user_id,
                                               const std::string& text) {
    return get_or_create(session_id, user_id)->process_message(text);
}

std::optional<std::string> SessionRegistry::fetch_pending_message(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) return std::nullopt;
    return session->fetch_pending();
}

OrderLines SessionRegistry::get_current_orders(const std::string& session_id) const {
    auto session = find(session_id);
    return session ? session->get_current_orders() : OrderLines{};
}

std::vector<OrderLines> SessionRegistry::get_confirmed_orders(const std::string& session_id) const {
    auto session = find(session_id);
    return session ? session->get_confirmed_orders() : std::vector<OrderLines>{};
}

void SessionRegistry::reset_session(const std::string& session_id, const std::string& user_id) {
    get_or_create(session_id, user_id)->restart();
}
