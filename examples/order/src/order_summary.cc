#include "order_summary.hpp"

#include "chronicle/errors.hpp"
#include "examples/order.pb.h"
#include "order.hpp"

namespace orders {

chronicle::EventTypeFilter order_summary_events() {
    return {"OrderPlaced", "ItemAdded", "OrderShipped", "OrderCancelled"};
}

void summarize_order(const chronicle::EventRecord& event, chronicle::ReadModel& model) {
    examples::OrderEvent order_event;
    if (!event.payload().UnpackTo(&order_event)) {
        throw chronicle::ProjectionHandlerError(kOrderSummaryProjection,
            "cannot decode " + event.event_type() + " " + event.event_id());
    }

    model.update(event.stream_id(), [&](nlohmann::json& row) {
        if (row.is_null()) {
            row = {{"customer_id", ""}, {"item_count", 0}, {"total_cents", 0},
                   {"status", ""}, {"version", 0}};
        }
        if (row["version"].get<uint64_t>() >= event.stream_version()) return;

        switch (order_event.event_case()) {
            case examples::OrderEvent::kOrderPlaced:
                row["customer_id"] = order_event.order_placed().customer_id();
                for (const auto& item : order_event.order_placed().items()) {
                    row["item_count"] = row["item_count"].get<int64_t>() + item.quantity();
                    row["total_cents"] = row["total_cents"].get<int64_t>() +
                                         item.price_cents() * item.quantity();
                }
                row["status"] = kStatusPlaced;
                break;
            case examples::OrderEvent::kItemAdded: {
                const auto& item = order_event.item_added().item();
                row["item_count"] = row["item_count"].get<int64_t>() + item.quantity();
                row["total_cents"] = row["total_cents"].get<int64_t>() +
                                     item.price_cents() * item.quantity();
                break;
            }
            case examples::OrderEvent::kOrderShipped:
                row["status"] = kStatusShipped;
                break;
            case examples::OrderEvent::kOrderCancelled:
                row["status"] = kStatusCancelled;
                break;
            case examples::OrderEvent::EVENT_NOT_SET:
                break;
        }
        row["version"] = event.stream_version();
    });
}

} // namespace orders
