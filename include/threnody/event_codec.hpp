#pragma once

#include "threnody/traversal_coordinator.hpp"
#include "threnody/types.hpp"

#include <boost/json.hpp>

#include <string>

namespace threnody {

// JSON shapes streamed to the renderer. Timestamps are epoch milliseconds.
boost::json::object message_to_json(const Message& message);
boost::json::object cluster_to_json(const MessageCluster& cluster);
boost::json::object working_set_change_to_json(const WorkingSetChange& change);
boost::json::object stats_to_json(const CoordinatorStats& stats);

// One line per event: {"type": "...", ...}
std::string encode_event(const MessageCluster& cluster);
std::string encode_event(const WorkingSetChange& change);
std::string encode_event(const CoordinatorStats& stats);

// Handles one inbound line {"content": "..."} and returns the reply event:
// {"type": "submitted", "message": {...}} or {"type": "submit_error", ...}.
// Never throws ThrenodyException.
std::string handle_submission_line(TraversalCoordinator& coordinator, const std::string& line);

} // namespace threnody
