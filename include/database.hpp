#ifndef DATABASE_HPP
#define DATABASE_HPP

#include "order_store.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Order persistence on Supabase (PostgREST) through libcurl.
// Table: confirmed_orders(user_id, session_id, product, quantity, status, order_group)
class Database : public OrderStore {
public:
    Database(const std::string& url, const std::string& key, const std::string& table = "confirmed_orders");

    void persist(const std::string& user_id,
                 const std::string& session_id,
                 const OrderLines& lines,
                 OrderStatus status,
                 const std::string& group) override;
    OrderLines query_aggregated(const std::string& user_id,
                                OrderStatus status,
                                const GroupFilter& filter) override;
    std::map<std::string, OrderLines> query_groups(const std::string& user_id,
                                                   OrderStatus status,
                                                   const GroupFilter& filter) override;
    void promote_group(const std::string& user_id, const std::string& group) override;
    void delete_group(const std::string& user_id, const std::string& group) override;

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    std::string supabase_url;
    std::string supabase_key;
    std::string table_name;

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
    Response perform_request(const std::string& method, const std::string& query, const std::string& body);
    nlohmann::json fetch_rows(const std::string& user_id, OrderStatus status, const GroupFilter& filter);
    std::string owner_filter(const std::string& user_id, const std::string& group);
};

#endif
