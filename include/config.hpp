#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "state_machine.hpp"
#include <string>
#include <vector>

struct BotConfig {
    std::vector<std::string> catalog;
    SessionSettings session;
    std::string supabase_url;  // empty: keep orders in memory
    std::string supabase_key;
    std::string websocket_url = "ws://localhost:8085/orders";
};

BotConfig default_config();

// Reads a JSON config file on top of the defaults. A missing file is not an
// error; an unreadable or malformed one throws std::runtime_error.
// SUPABASE_URL, SUPABASE_KEY and ORDER_BOT_WS_URL override the file.
BotConfig load_config(const std::string& path);

#endif
