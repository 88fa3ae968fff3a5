#ifndef CTXBRIDGE_AGGREGATION_STRATEGIES_HPP
#define CTXBRIDGE_AGGREGATION_STRATEGIES_HPP

// Per-command merge policies for aggregated (workspace-wide) requests.
// List-shaped results are concatenated and every item is tagged with the windowId it came from;
// commands without a dedicated policy answer with the primary's own payload.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace aggregation_strategies {

using json = nlohmann::json;

// One window's answer. payload is a success payload or an error payload (success:false).
struct Contribution {
    std::string window_id;
    json payload;
    bool is_local = false;
};

// Merge contributions for command into the single payload sent to the requester.
// original_payload is the request payload (search echoes its query).
json merge(const std::string &command, const std::vector<Contribution> &contributions,
           const std::string &primary_window_id, const json &original_payload);

// Tag every object in items that lacks windowId.
void tag_with_window(json &items, const std::string &window_id);

} // namespace aggregation_strategies

#endif // CTXBRIDGE_AGGREGATION_STRATEGIES_HPP
