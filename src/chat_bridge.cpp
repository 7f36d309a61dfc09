#include "chat_bridge.hpp"
#include <iostream>

namespace {

const char* DEFAULT_USER = "default";

nlohmann::json ack(const std::string& action, bool success, const std::string& error = "") {
    nlohmann::json j = {{"type", "ack"}, {"action", action}, {"success", success}};
    if (!error.empty()) j["error"] = error;
    return j;
}

}

ChatBridge::ChatBridge(SessionRegistry& registry, const std::string& url) : registry(registry), url(url) {
    webSocket.setUrl(url);
    webSocket.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        if (msg->type == ix::WebSocketMessageType::Message) {
            nlohmann::json frame;
            try {
                frame = nlohmann::json::parse(msg->str);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[ERROR] Dropping malformed frame: " << e.what() << std::endl;
                return;
            }
            send_websocket_message(handle_frame(frame));
        } else if (msg->type == ix::WebSocketMessageType::Open) {
            std::cout << "[INFO] Connected to chat relay at " << this->url << std::endl;
        } else if (msg->type == ix::WebSocketMessageType::Error) {
            std::cerr << "[ERROR] Connection error: " << msg->errorInfo.reason << std::endl;
        }
    });
}

ChatBridge::~ChatBridge() {
    stop();
}

void ChatBridge::start() {
    webSocket.start();
}

void ChatBridge::stop() {
    webSocket.stop();
}

void ChatBridge::send_websocket_message(const nlohmann::json& message) {
    if (webSocket.getReadyState() == ix::ReadyState::Open) {
        webSocket.send(message.dump());
    }
}

size_t ChatBridge::poll_pending() {
    size_t sent = 0;
    for (const auto& id : registry.session_ids()) {
        while (auto text = registry.fetch_pending_message(id)) {
            send_websocket_message({{"type", "botMessage"}, {"session", id}, {"text", *text}});
            ++sent;
        }
    }
    return sent;
}

nlohmann::json ChatBridge::orders_frame(const std::string& session_id, const std::string& user_id) {
    auto session = registry.get_or_create(session_id, user_id);
    nlohmann::json j = {{"type", "orders"},
                        {"session", session->id()},
                        {"state", to_string(session->state())},
                        {"current_orders", session->get_current_orders()},
                        {"confirmed_orders", session->get_confirmed_orders()},
                        {"pending_orders", session->get_pending_orders()}};
    try {
        GlobalOrders global = registry.order_store().global_orders(session->user());
        j["global"] = {{"main_orders", global.main_orders}, {"auto_orders", global.auto_orders}};
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not load saved orders: " << e.what() << std::endl;
        j["global"] = nullptr;
    }
    return j;
}

nlohmann::json ChatBridge::handle_frame(const nlohmann::json& frame) {
    if (!frame.is_object()) return {{"type", "error"}, {"message", "frame must be a JSON object"}};

    const std::string type = frame.value("type", "");
    const std::string session_id = frame.value("session", "");
    const std::string user_id = frame.value("user", DEFAULT_USER);

    if (type == "userMessage") {
        auto session = registry.get_or_create(session_id, user_id);
        MessageResult result = session->process_message(frame.value("text", ""));
        nlohmann::json reply = {{"type", "botReply"}, {"session", session->id()}, {"accepted", result.accepted}};
        reply["message"] = result.message ? nlohmann::json(*result.message) : nlohmann::json(nullptr);
        return reply;
    }
    if (type == "getOrders") {
        return orders_frame(session_id, user_id);
    }
    if (type == "confirmAutoOrder" || type == "deleteAutoOrder") {
        const std::string group = frame.value("group", "");
        if (group.empty()) return ack(type, false, "missing group");
        try {
            if (type == "confirmAutoOrder") {
                registry.order_store().promote_group(user_id, group);
            } else {
                registry.order_store().delete_group(user_id, group);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << type << " " << group << ": " << e.what() << std::endl;
            return ack(type, false, e.what());
        }
        return ack(type, true);
    }
    if (type == "resetSession") {
        registry.reset_session(session_id, user_id);
        return ack(type, true);
    }

    std::cerr << "[ERROR] Unknown frame type: " << type << std::endl;
    return {{"type", "error"}, {"message", "unknown frame type: " + type}};
}
