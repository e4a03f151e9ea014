#pragma once

#include "chronicle/event.hpp"
#include "chronicle/read_model.hpp"

namespace orders {

constexpr const char* kOrderSummaryProjection = "order-summary";

/**
 * Event types the order summary listens to.
 */
chronicle::EventTypeFilter order_summary_events();

/**
 * Maintains one row per order stream:
 *   {"customer_id", "item_count", "total_cents", "status", "version"}
 *
 * Rows remember the last stream version folded in, so redelivered events
 * are ignored.
 */
void summarize_order(const chronicle::EventRecord& event, chronicle::ReadModel& model);

} // namespace orders
