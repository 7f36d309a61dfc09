#include "ids.hpp"
#include <chrono>
#include <mutex>
#include <random>

namespace {

std::string random_chars(const std::string& alphabet, size_t count) {
    static std::mutex mutex;
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);

    std::lock_guard<std::mutex> lock(mutex);
    std::string out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) out += alphabet[pick(rng)];
    return out;
}

}

std::string generate_session_id() {
    static const std::string hex = "0123456789abcdef";
    return random_chars(hex, 8) + "-" + random_chars(hex, 4) + "-" + random_chars(hex, 4) + "-" +
           random_chars(hex, 4) + "-" + random_chars(hex, 12);
}

std::string generate_auto_group_id() {
    using namespace std::chrono;
    std::string stamp = std::to_string(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
    if (stamp.size() > 6) stamp = stamp.substr(stamp.size() - 6);
    return "auto_" + stamp + "_" + random_chars("abcdefghijklmnopqrstuvwxyz0123456789", 6);
}
