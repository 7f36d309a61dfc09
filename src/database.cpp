#include "database.hpp"
#include <curl/curl.h>
#include <iostream>
#include <stdexcept>

namespace {

std::string escape(CURL* curl, const std::string& value) {
    char* encoded = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!encoded) throw std::runtime_error("curl_easy_escape failed");
    std::string out(encoded);
    curl_free(encoded);
    return out;
}

std::string url_escape(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");
    std::string out;
    try {
        out = escape(curl, value);
    } catch (const std::exception&) {
        curl_easy_cleanup(curl);
        throw;
    }
    curl_easy_cleanup(curl);
    return out;
}

}

Database::Database(const std::string& url, const std::string& key, const std::string& table)
    : supabase_url(url), supabase_key(key), table_name(table) {}

size_t Database::WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Database::Response Database::perform_request(const std::string& method,
                                             const std::string& query,
                                             const std::string& body) {
    Response response;
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::string url = supabase_url + "/rest/v1/" + table_name + query;
    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, ("apikey: " + supabase_key).c_str());
    headers = curl_slist_append(headers, ("Authorization: Bearer " + supabase_key).c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Prefer: return=minimal");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty()) curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw std::runtime_error(method + " " + table_name + " failed: " + curl_easy_strerror(res));
    }
    if (response.status < 200 || response.status >= 300) {
        throw std::runtime_error(method + " " + table_name + " returned HTTP " +
                                 std::to_string(response.status) + ": " + response.body);
    }
    return response;
}

std::string Database::owner_filter(const std::string& user_id, const std::string& group) {
    return "?user_id=eq." + url_escape(user_id) +
           "&order_group=eq." + url_escape(group) +
           "&status=eq." + to_string(OrderStatus::AUTO_CONFIRMED);
}

void Database::persist(const std::string& user_id,
                       const std::string& session_id,
                       const OrderLines& lines,
                       OrderStatus status,
                       const std::string& group) {
    nlohmann::json rows = nlohmann::json::array();
    for (auto const& [product, qty] : lines) {
        if (qty <= 0) continue;
        rows.push_back({{"user_id", user_id},
                        {"session_id", session_id},
                        {"product", product},
                        {"quantity", qty},
                        {"status", to_string(status)},
                        {"order_group", group}});
    }
    if (rows.empty()) return;

    perform_request("POST", "", rows.dump());
    std::cout << "[INFO] Saved " << rows.size() << " row(s) as " << to_string(status)
              << " in group " << group << std::endl;
}

nlohmann::json Database::fetch_rows(const std::string& user_id, OrderStatus status, const GroupFilter& filter) {
    std::string query = "?select=order_group,product,quantity"
                        "&user_id=eq." + url_escape(user_id) +
                        "&status=eq." + to_string(status) +
                        "&order_group=" + (filter.exclude ? "neq." : "eq.") + url_escape(filter.group) +
                        "&order=order_group,product";
    Response resp = perform_request("GET", query, "");
    try {
        auto rows = nlohmann::json::parse(resp.body);
        if (!rows.is_array()) throw std::runtime_error("expected a JSON array");
        return rows;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Bad response from " + table_name + ": " + e.what());
    }
}

OrderLines Database::query_aggregated(const std::string& user_id,
                                      OrderStatus status,
                                      const GroupFilter& filter) {
    OrderLines totals;
    for (auto& item : fetch_rows(user_id, status, filter)) {
        std::string product = item.value("product", "");
        int qty = item.value("quantity", 0);
        if (!product.empty() && qty > 0) totals[product] += qty;
    }
    return totals;
}

std::map<std::string, OrderLines> Database::query_groups(const std::string& user_id,
                                                         OrderStatus status,
                                                         const GroupFilter& filter) {
    std::map<std::string, OrderLines> groups;
    for (auto& item : fetch_rows(user_id, status, filter)) {
        std::string group = item.value("order_group", MAIN_GROUP);
        std::string product = item.value("product", "");
        int qty = item.value("quantity", 0);
        if (!product.empty() && qty > 0) groups[group][product] += qty;
    }
    return groups;
}

void Database::promote_group(const std::string& user_id, const std::string& group) {
    nlohmann::json patch = {{"status", to_string(OrderStatus::CONFIRMED)}, {"order_group", MAIN_GROUP}};
    perform_request("PATCH", owner_filter(user_id, group), patch.dump());
}

void Database::delete_group(const std::string& user_id, const std::string& group) {
    perform_request("DELETE", owner_filter(user_id, group), "");
}
