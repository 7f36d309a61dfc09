#include "order_store.hpp"
#include <algorithm>

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::CONFIRMED: return "confirmed";
        case OrderStatus::AUTO_CONFIRMED: return "auto_confirmed";
        case OrderStatus::PENDING: return "pending";
    }
    return "pending";
}

GlobalOrders OrderStore::global_orders(const std::string& user_id) {
    GlobalOrders out;
    out.main_orders = query_aggregated(user_id, OrderStatus::CONFIRMED, GroupFilter::only(MAIN_GROUP));
    out.auto_orders = query_groups(user_id, OrderStatus::AUTO_CONFIRMED, GroupFilter::except(MAIN_GROUP));
    return out;
}

void InMemoryOrderStore::persist(const std::string& user_id,
                                 const std::string& session_id,
                                 const OrderLines& lines,
                                 OrderStatus status,
                                 const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [product, qty] : lines) {
        if (qty > 0) data.push_back({user_id, session_id, product, qty, status, group});
    }
}

OrderLines InMemoryOrderStore::query_aggregated(const std::string& user_id,
                                                OrderStatus status,
                                                const GroupFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex);
    OrderLines totals;
    for (const auto& row : data) {
        if (row.user_id == user_id && row.status == status && filter.accepts(row.group)) {
            totals[row.product] += row.quantity;
        }
    }
    return totals;
}

std::map<std::string, OrderLines> InMemoryOrderStore::query_groups(const std::string& user_id,
                                                                   OrderStatus status,
                                                                   const GroupFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex);
    std::map<std::string, OrderLines> groups;
    for (const auto& row : data) {
        if (row.user_id == user_id && row.status == status && filter.accepts(row.group)) {
            groups[row.group][row.product] += row.quantity;
        }
    }
    return groups;
}

void InMemoryOrderStore::promote_group(const std::string& user_id, const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& row : data) {
        if (row.user_id == user_id && row.group == group && row.status == OrderStatus::AUTO_CONFIRMED) {
            row.status = OrderStatus::CONFIRMED;
            row.group = MAIN_GROUP;
        }
    }
}

void InMemoryOrderStore::delete_group(const std::string& user_id, const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex);
    data.erase(std::remove_if(data.begin(), data.end(), [&](const Row& row) {
                   return row.user_id == user_id && row.group == group &&
                          row.status == OrderStatus::AUTO_CONFIRMED;
               }),
               data.end());
}

std::vector<InMemoryOrderStore::Row> InMemoryOrderStore::rows() const {
    std::lock_guard<std::mutex> lock(mutex);
    return data;
}
