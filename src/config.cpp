#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace {

void apply_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) target = value;
}

std::chrono::milliseconds seconds_field(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    double seconds = j.at(key).get<double>();
    if (seconds <= 0) throw std::runtime_error(std::string(key) + " must be positive");
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

}

BotConfig default_config() {
    BotConfig cfg;
    cfg.catalog = default_product_names();
    return cfg;
}

BotConfig load_config(const std::string& path) {
    BotConfig cfg = default_config();

    if (!path.empty() && std::filesystem::exists(path)) {
        std::ifstream f(path);
        if (!f) throw std::runtime_error("Cannot open config file " + path);

        try {
            nlohmann::json j;
            f >> j;

            if (j.contains("catalog")) {
                cfg.catalog = j.at("catalog").get<std::vector<std::string>>();
                if (cfg.catalog.empty()) throw std::runtime_error("catalog must not be empty");
            }
            cfg.session.inactivity_delay = seconds_field(j, "inactivity_seconds", cfg.session.inactivity_delay);
            cfg.session.reminder_interval = seconds_field(j, "reminder_seconds", cfg.session.reminder_interval);
            cfg.session.max_reminders = j.value("max_reminders", cfg.session.max_reminders);
            if (cfg.session.max_reminders < 1) throw std::runtime_error("max_reminders must be at least 1");
            cfg.session.extractor.match_threshold = j.value("match_threshold", cfg.session.extractor.match_threshold);
            cfg.session.extractor.fallback_threshold =
                j.value("fallback_threshold", cfg.session.extractor.fallback_threshold);

            std::string mode = j.value("auto_confirm_mode", std::string("auto"));
            if (mode == "auto") {
                cfg.session.auto_confirm_mode = AutoConfirmMode::AUTO_CONFIRM;
            } else if (mode == "hold") {
                cfg.session.auto_confirm_mode = AutoConfirmMode::HOLD_PENDING;
            } else {
                throw std::runtime_error("auto_confirm_mode must be \"auto\" or \"hold\", got \"" + mode + "\"");
            }

            cfg.supabase_url = j.value("supabase_url", cfg.supabase_url);
            cfg.supabase_key = j.value("supabase_key", cfg.supabase_key);
            cfg.websocket_url = j.value("websocket_url", cfg.websocket_url);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path + ": " + e.what());
        }
        std::cout << "[INFO] Loaded config from " << path << std::endl;
    }

    apply_env("SUPABASE_URL", cfg.supabase_url);
    apply_env("SUPABASE_KEY", cfg.supabase_key);
    apply_env("ORDER_BOT_WS_URL", cfg.websocket_url);
    return cfg;
}
