#pragma once

#include "threnody/config.hpp"
#include "threnody/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace threnody {

using WorkingSet = std::map<MessageId, Message>;
using PriorityIds = std::set<MessageId>;

struct ClusterStats {
    size_t total_messages = 0;
    double avg_similarity = 0.0;
    double min_similarity = 0.0;
    double max_similarity = 0.0;
    double diversity = 0.0;
};

/**
 * Picks the next displayable group out of the working set.
 *
 * Focus follows the previous cluster's next when it is still present, so
 * consecutive clusters chain. The previous focus is kept in related with a
 * similarity of 1.0, and at least one first-class member is carried in
 * related whenever the working set holds one.
 *
 * Stateless apart from configuration; safe to call from any thread.
 * select() may be overridden to supply another strategy.
 */
class ClusterSelector {
public:
    explicit ClusterSelector(const EngineConfig& config);
    virtual ~ClusterSelector() = default;

    // Returns a placeholder cluster when the working set is empty.
    // Throws InvariantViolationError if the result fails validate().
    virtual MessageCluster select(const WorkingSet& working_set,
                          const PriorityIds& priority_ids,
                          const MessageCluster* previous) const;

    // First violated post-condition, or nullopt when the cluster is well formed
    std::optional<std::string> validate(const MessageCluster& cluster, size_t working_set_size) const;

    ClusterStats cluster_stats(const MessageCluster& cluster) const;

    // Maximum number of related entries
    size_t related_capacity() const;

private:
    EngineConfig config_;
};

} // namespace threnody
