#include "order.hpp"

#include "chronicle/errors.hpp"

namespace orders {

using chronicle::ValidationError;

namespace {

void validate_item(const examples::LineItem& item) {
    if (item.sku().empty()) throw ValidationError("Item SKU is required");
    if (item.quantity() <= 0) throw ValidationError("Item quantity must be positive");
    if (item.price_cents() < 0) throw ValidationError("Item price cannot be negative");
}

int64_t line_total(const examples::LineItem& item) {
    return item.price_cents() * item.quantity();
}

} // namespace

void Order::place(const std::string& customer_id, const std::vector<examples::LineItem>& items) {
    if (exists()) throw ValidationError("Order already exists");
    if (customer_id.empty()) throw ValidationError("Customer ID is required");
    if (items.empty()) throw ValidationError("Order must have items");
    for (const auto& item : items) validate_item(item);

    examples::OrderEvent event;
    auto* placed = event.mutable_order_placed();
    placed->set_customer_id(customer_id);
    for (const auto& item : items) {
        *placed->add_items() = item;
    }
    raise(event);
}

void Order::add_item(const examples::LineItem& item) {
    require_placed();
    validate_item(item);

    examples::OrderEvent event;
    *event.mutable_item_added()->mutable_item() = item;
    raise(event);
}

void Order::ship(const std::string& carrier) {
    require_placed();
    if (carrier.empty()) throw ValidationError("Carrier is required");

    examples::OrderEvent event;
    event.mutable_order_shipped()->set_carrier(carrier);
    raise(event);
}

void Order::cancel(const std::string& reason) {
    require_placed();

    examples::OrderEvent event;
    event.mutable_order_cancelled()->set_reason(reason);
    raise(event);
}

void Order::apply(examples::OrderState& state, const examples::OrderEvent& event) const {
    switch (event.event_case()) {
        case examples::OrderEvent::kOrderPlaced:
            state.set_customer_id(event.order_placed().customer_id());
            for (const auto& item : event.order_placed().items()) {
                *state.add_items() = item;
                state.set_total_cents(state.total_cents() + line_total(item));
            }
            state.set_status(kStatusPlaced);
            break;
        case examples::OrderEvent::kItemAdded:
            *state.add_items() = event.item_added().item();
            state.set_total_cents(state.total_cents() + line_total(event.item_added().item()));
            break;
        case examples::OrderEvent::kOrderShipped:
            state.set_status(kStatusShipped);
            break;
        case examples::OrderEvent::kOrderCancelled:
            state.set_status(kStatusCancelled);
            break;
        case examples::OrderEvent::EVENT_NOT_SET:
            break;
    }
}

void Order::require_placed() const {
    if (!exists()) throw ValidationError("Order does not exist");
    if (state().status() != kStatusPlaced) {
        throw ValidationError("Order is " + state().status());
    }
}

} // namespace orders
