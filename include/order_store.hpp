#ifndef ORDER_STORE_HPP
#define ORDER_STORE_HPP

#include "catalog.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

enum class OrderStatus {
    CONFIRMED,
    AUTO_CONFIRMED,
    PENDING
};

std::string to_string(OrderStatus status);

// Group every confirmed order lands in; auto-confirmed orders get their own.
inline const std::string MAIN_GROUP = "main";

struct GroupFilter {
    std::string group;
    bool exclude = false; // true: every group except `group`

    static GroupFilter only(const std::string& g) { return {g, false}; }
    static GroupFilter except(const std::string& g) { return {g, true}; }
    bool accepts(const std::string& g) const { return exclude ? g != group : g == group; }
};

struct GlobalOrders {
    OrderLines main_orders;                         // confirmed, summed per product
    std::map<std::string, OrderLines> auto_orders;  // auto-confirmed, per group
};

// Where confirmed orders end up. Implementations throw std::runtime_error
// when the backing storage fails.
class OrderStore {
public:
    virtual ~OrderStore() = default;

    virtual void persist(const std::string& user_id,
                         const std::string& session_id,
                         const OrderLines& lines,
                         OrderStatus status,
                         const std::string& group) = 0;

    // product -> summed quantity over matching rows
    virtual OrderLines query_aggregated(const std::string& user_id,
                                        OrderStatus status,
                                        const GroupFilter& filter) = 0;

    // group -> product -> summed quantity
    virtual std::map<std::string, OrderLines> query_groups(const std::string& user_id,
                                                           OrderStatus status,
                                                           const GroupFilter& filter) = 0;

    // Moves an auto-confirmed group into the main confirmed list.
    virtual void promote_group(const std::string& user_id, const std::string& group) = 0;

    // Drops an auto-confirmed group.
    virtual void delete_group(const std::string& user_id, const std::string& group) = 0;

    GlobalOrders global_orders(const std::string& user_id);
};

class InMemoryOrderStore : public OrderStore {
public:
    struct Row {
        std::string user_id;
        std::string session_id;
        std::string product;
        int quantity;
        OrderStatus status;
        std::string group;
    };

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

    std::vector<Row> rows() const;

private:
    mutable std::mutex mutex;
    std::vector<Row> data;
};

#endif
