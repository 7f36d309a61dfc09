#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include "state_machine.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// session id -> ConversationSession, created on first use and kept for the
// lifetime of the process.
class SessionRegistry {
public:
    SessionRegistry(std::vector<std::string> product_names,
                    std::shared_ptr<Scheduler> scheduler,
                    std::shared_ptr<OrderStore> store,
                    SessionSettings settings = {});

    // An empty session id gets a freshly generated one.
    std::shared_ptr<ConversationSession> get_or_create(const std::string& session_id, const std::string& user_id);
    std::shared_ptr<ConversationSession> find(const std::string& session_id) const;

    std::vector<std::string> session_ids() const;
    size_t size() const;

    MessageResult process_message(const std::string& session_id, const std::string& user_id, const std::string& text);
    std::optional<std::string> fetch_pending_message(const std::string& session_id) const;
    OrderLines get_current_orders(const std::string& session_id) const;
    std::vector<OrderLines> get_confirmed_orders(const std::string& session_id) const;
    void reset_session(const std::string& session_id, const std::string& user_id);

    OrderStore& order_store() { return *store; }

private:
    const std::vector<std::string> product_names;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<OrderStore> store;
    const SessionSettings settings;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<ConversationSession>> sessions;
};

#endif
