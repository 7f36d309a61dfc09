#ifndef CHAT_BRIDGE_HPP
#define CHAT_BRIDGE_HPP

#include "session_registry.hpp"
#include <string>
#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>

// Connects to the chat relay over WebSocket and answers its JSON frames:
//   userMessage      {session, user, text}  -> botReply
//   getOrders        {session, user}        -> orders
//   confirmAutoOrder {user, group}          -> ack
//   deleteAutoOrder  {user, group}          -> ack
//   resetSession     {session, user}        -> ack
// Messages queued by timers are pushed as botMessage frames by poll_pending().
class ChatBridge {
public:
    ChatBridge(SessionRegistry& registry, const std::string& url);
    ~ChatBridge();

    void start();
    void stop();

    // Sends every queued timer message; returns how many were sent.
    size_t poll_pending();

    nlohmann::json handle_frame(const nlohmann::json& frame);

private:
    void send_websocket_message(const nlohmann::json& message);
    nlohmann::json orders_frame(const std::string& session_id, const std::string& user_id);

    SessionRegistry& registry;
    std::string url;
    ix::WebSocket webSocket;
};

#endif
