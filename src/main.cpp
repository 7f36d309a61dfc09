#include "chat_bridge.hpp"
#include "config.hpp"
#include "database.hpp"
#include "session_registry.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <curl/curl.h>

namespace {

std::atomic<bool> isRunning{true};

void handle_signal(int) {
    isRunning = false;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <file.json>] [--console]\n"
              << "  --config   JSON settings (catalog, timers, supabase_url, websocket_url)\n"
              << "  --console  chat from the terminal instead of the WebSocket relay\n";
}

// One session driven from stdin; timer messages are printed as they arrive.
int run_console(SessionRegistry& registry) {
    const std::string session_id = "console";
    auto session = registry.get_or_create(session_id, "console");

    std::thread printer([&] {
        while (isRunning) {
            while (auto msg = session->fetch_pending()) std::cout << "\n" << *msg << "\n> " << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    std::string line;
    std::cout << "> " << std::flush;
    while (isRunning && std::getline(std::cin, line)) {
        MessageResult result = session->process_message(line);
        if (result.message) std::cout << *result.message << "\n";
        if (!result.accepted) std::cout << "(rejected)\n";
        std::cout << "> " << std::flush;
    }
    isRunning = false;
    printer.join();
    return 0;
}

int run_bridge(SessionRegistry& registry, const std::string& url) {
    ChatBridge bridge(registry, url);
    bridge.start();
    while (isRunning) {
        bridge.poll_pending();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    bridge.stop();
    return 0;
}

}

int main(int argc, char** argv) {
    std::string config_path = "order_bot.json";
    bool console = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--console") {
            console = true;
        } else {
            print_usage(argv[0]);
            return arg == "--help" || arg == "-h" ? 0 : 2;
        }
    }

    BotConfig config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    std::shared_ptr<OrderStore> store;
    if (!config.supabase_url.empty()) {
        store = std::make_shared<Database>(config.supabase_url, config.supabase_key);
        std::cout << "[INFO] Saving orders to " << config.supabase_url << std::endl;
    } else {
        store = std::make_shared<InMemoryOrderStore>();
        std::cout << "[INFO] No supabase_url set, orders are kept in memory" << std::endl;
    }

    auto scheduler = std::make_shared<ThreadScheduler>();
    int rc = 0;
    {
        SessionRegistry registry(config.catalog, scheduler, store, config.session);
        rc = console ? run_console(registry) : run_bridge(registry, config.websocket_url);
        scheduler->stop();
    }

    curl_global_cleanup();
    return rc;
}
