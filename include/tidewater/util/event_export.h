#pragma once

#include <string>
#include <vector>

#include "tidewater/core/events.h"

namespace tidewater {

// Format simulation events as CSV.
//
// Columns: seq,time,type,ship_id,customer_id,location,amount,detail
//
// - Events are exported in the order provided.
// - `amount` is the quantity the event is about (consumed, requested, unloaded,
//   needed or cargo on board); empty when the event has none.
// - `detail` packs the remaining fields as key=value pairs separated by ';'.
// - Output ends with a trailing newline.
std::string events_to_csv(const std::vector<SimEvent>& events);

// Format simulation events as JSON Lines, one results-document event object per line.
//
// Output ends with a trailing newline (or is empty when there are no events).
std::string events_to_jsonl(const std::vector<SimEvent>& events);

} // namespace tidewater
