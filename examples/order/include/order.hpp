#pragma once

#include <string>
#include <vector>
#include "chronicle/aggregate.hpp"
#include "examples/order.pb.h"

namespace orders {

constexpr const char* kStatusPlaced = "placed";
constexpr const char* kStatusShipped = "shipped";
constexpr const char* kStatusCancelled = "cancelled";

class Order : public chronicle::Aggregate<examples::OrderState, examples::OrderEvent> {
public:
    void place(const std::string& customer_id, const std::vector<examples::LineItem>& items);
    void add_item(const examples::LineItem& item);
    void ship(const std::string& carrier);
    void cancel(const std::string& reason);

    const std::string& status() const { return state().status(); }
    int64_t total_cents() const { return state().total_cents(); }

protected:
    examples::OrderState create_empty_state() const override { return examples::OrderState{}; }
    void apply(examples::OrderState& state, const examples::OrderEvent& event) const override;

private:
    void require_placed() const;
};

} // namespace orders
