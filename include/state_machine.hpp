#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include "catalog.hpp"
#include "order_extractor.hpp"
#include "order_store.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ConversationState {
    WAITING_FOR_NEXT,
    OPTION,
    COLLECTING,
    CONFIRMING,
    PENDING_CONFIRMATION
};

std::string to_string(ConversationState state);

// What happens when the last reminder goes unanswered.
enum class AutoConfirmMode {
    AUTO_CONFIRM, // save as its own auto-confirmed group
    HOLD_PENDING  // park it in pending orders and ask again
};

struct SessionSettings {
    std::chrono::milliseconds inactivity_delay{5000};
    std::chrono::milliseconds reminder_interval{5000};
    int max_reminders = 5;
    AutoConfirmMode auto_confirm_mode = AutoConfirmMode::AUTO_CONFIRM;
    ExtractorOptions extractor;
};

struct MessageResult {
    bool accepted;
    std::optional<std::string> message;
};

// One user's conversation: collects items, asks for confirmation after a
// quiet period, reminds, and auto-confirms when the reminders run out.
// Must be owned by a std::shared_ptr for its timers to fire.
class ConversationSession : public std::enable_shared_from_this<ConversationSession> {
public:
    ConversationSession(std::string session_id,
                        std::string user_id,
                        std::vector<std::string> product_names,
                        std::shared_ptr<Scheduler> scheduler,
                        std::shared_ptr<OrderStore> store,
                        SessionSettings settings = {});
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    MessageResult process_message(const std::string& text);

    // Oldest message queued by a timer, if any. Never blocks.
    std::optional<std::string> fetch_pending();

    // Drops the working and pending orders and starts over from the menu.
    void restart();

    OrderLines get_current_orders() const;
    std::vector<OrderLines> get_confirmed_orders() const;
    std::vector<OrderLines> get_pending_orders() const;
    ConversationState state() const;
    int reminder_count() const;

    const std::string& id() const { return session_id; }
    const std::string& user() const { return user_id; }

private:
    enum class TimerKind { INACTIVITY, REMINDER };

    // Everything below expects `mutex` to be held.
    MessageResult handle_option(const std::string& command);
    MessageResult handle_collecting(const std::string& text, const std::string& command);
    MessageResult handle_confirming(const std::string& text, const std::vector<std::string>& words);
    MessageResult handle_pending(const std::string& text, const std::vector<std::string>& words);

    void arm_timer(TimerKind kind, std::chrono::milliseconds delay);
    void cancel_timer();
    void on_timer(TimerKind kind, std::uint64_t generation);

    void send_summary();
    void start_reminder_cycle();
    void send_reminder();
    void auto_confirm();

    std::vector<ParsedOrderLine> merge_order(const std::string& text);
    void reset_current();
    bool has_items() const;
    std::string build_summary() const;
    void enqueue(const std::string& message);
    void save_orders(const OrderLines& lines, OrderStatus status, const std::string& group);

    const std::string session_id;
    const std::string user_id;
    const std::vector<std::string> product_names;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<OrderStore> store;
    const SessionSettings settings;
    const OrderExtractor extractor;

    mutable std::mutex mutex;
    ConversationState current_state = ConversationState::WAITING_FOR_NEXT;
    std::shared_ptr<const WorkingCatalog> working;
    std::vector<OrderLines> confirmed_orders;
    std::vector<OrderLines> pending_orders;
    int reminders = 0;
    std::deque<std::string> outgoing;
    TimerHandle timer;
    std::uint64_t timer_generation = 0;
};

#endif
