#include "threnody/cluster_selector.hpp"
#include "threnody/error.hpp"
#include "threnody/similarity.hpp"
#include "threnody/util/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <vector>

namespace threnody {

namespace {

bool ranks_before(const RelatedMessage& a, const RelatedMessage& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.message.id < b.message.id;
}

const Message& choose_focus(const WorkingSet& working_set, const PriorityIds& priority_ids,
                            const MessageCluster* previous) {
    if (previous && previous->next) {
        auto it = working_set.find(previous->next->id);
        if (it != working_set.end()) return it->second;
    }
    for (MessageId id : priority_ids) {
        auto it = working_set.find(id);
        if (it != working_set.end()) return it->second;
    }
    return working_set.begin()->second;
}

} // namespace

ClusterSelector::ClusterSelector(const EngineConfig& config) : config_(config) {
    THRENODY_CHECK_ARGUMENT(config_.cluster_size >= 1, "cluster_size must be at least 1");
}

size_t ClusterSelector::related_capacity() const {
    return config_.cluster_size > 0 ? config_.cluster_size - 1 : 0;
}

MessageCluster ClusterSelector::select(const WorkingSet& working_set,
                                       const PriorityIds& priority_ids,
                                       const MessageCluster* previous) const {
    MessageCluster cluster;
    cluster.duration_ms = config_.cluster_duration_ms;
    cluster.timestamp = Clock::now();

    if (working_set.empty()) {
        return cluster;
    }

    const Message& focus = choose_focus(working_set, priority_ids, previous);
    cluster.focus = focus;

    std::optional<MessageId> previous_focus;
    if (previous && previous->focus && previous->focus->id != focus.id &&
        working_set.count(previous->focus->id)) {
        previous_focus = previous->focus->id;
    }

    // 1. Rank everything else against the focus
    std::vector<RelatedMessage> scored;
    scored.reserve(working_set.size() - 1);
    for (const auto& [id, msg] : working_set) {
        if (id == focus.id) continue;
        scored.push_back({msg, similarity(focus, msg, config_.similarity)});
    }
    std::sort(scored.begin(), scored.end(), ranks_before);

    size_t capacity = related_capacity();
    std::vector<RelatedMessage> related(scored.begin(),
                                        scored.begin() + std::min(capacity, scored.size()));

    // 2. Carry a first-class member when the ranking left all of them out
    std::optional<MessageId> injected;
    bool has_priority = std::any_of(related.begin(), related.end(), [&](const RelatedMessage& r) {
        return priority_ids.count(r.message.id) > 0;
    });
    if (!has_priority && !related.empty() && related.size() == capacity) {
        for (MessageId id : priority_ids) {
            if (id == focus.id || (previous_focus && id == *previous_focus)) continue;
            auto it = std::find_if(scored.begin(), scored.end(),
                                   [id](const RelatedMessage& r) { return r.message.id == id; });
            if (it == scored.end()) continue;
            related.back() = *it;
            injected = id;
            break;
        }
    }

    // 3. Continuity: the previous focus stays on screen
    if (previous_focus) {
        bool present = std::any_of(related.begin(), related.end(), [&](const RelatedMessage& r) {
            return r.message.id == *previous_focus;
        });
        if (!present && capacity > 0) {
            RelatedMessage kept{working_set.at(*previous_focus), 1.0};
            if (related.size() < capacity) {
                related.push_back(std::move(kept));
            } else {
                std::sort(related.begin(), related.end(), ranks_before);
                auto victim = related.end() - 1;
                if (injected && victim->message.id == *injected && related.size() > 1) {
                    --victim;
                }
                *victim = std::move(kept);
            }
        }
    }
    std::sort(related.begin(), related.end(), ranks_before);

    // 4. Next: first-class members first, never straight back to the previous focus
    std::vector<const RelatedMessage*> candidates;
    for (const auto& r : related) {
        if (previous_focus && r.message.id == *previous_focus) continue;
        candidates.push_back(&r);
    }
    if (candidates.empty() && !related.empty()) {
        candidates.push_back(&related.front());
    }

    const RelatedMessage* next = nullptr;
    for (const RelatedMessage* c : candidates) {
        if (priority_ids.count(c->message.id) && (!next || c->message.id < next->message.id)) {
            next = c;
        }
    }
    if (!next && !candidates.empty()) {
        next = candidates.front();
    }
    cluster.next = next ? next->message : focus;
    cluster.related = std::move(related);

    if (auto violation = validate(cluster, working_set.size())) {
        THRENODY_THROW_INVARIANT(*violation);
    }
    return cluster;
}

std::optional<std::string> ClusterSelector::validate(const MessageCluster& cluster,
                                                     size_t working_set_size) const {
    if (cluster.is_placeholder()) {
        if (!cluster.related.empty()) return std::string("placeholder cluster has related messages");
        if (cluster.next) return std::string("placeholder cluster has a next message");
        return std::nullopt;
    }

    MessageId focus_id = cluster.focus->id;
    std::unordered_set<MessageId> ids;
    for (const auto& r : cluster.related) {
        if (r.message.id == focus_id) {
            return "focus " + std::to_string(focus_id) + " appears in its own related";
        }
        if (!ids.insert(r.message.id).second) {
            return "duplicate related id " + std::to_string(r.message.id);
        }
    }

    size_t capacity = related_capacity();
    if (cluster.related.size() > capacity) {
        return "related holds " + std::to_string(cluster.related.size()) +
               " entries, capacity is " + std::to_string(capacity);
    }
    size_t others = working_set_size > 0 ? working_set_size - 1 : 0;
    size_t minimum = std::min(capacity, others);
    if (cluster.related.size() < minimum) {
        return "related holds " + std::to_string(cluster.related.size()) +
               " entries, expected at least " + std::to_string(minimum);
    }

    if (!cluster.next) {
        return std::string("cluster has no next message");
    }
    if (cluster.related.empty()) {
        if (cluster.next->id != focus_id) {
            return "next " + std::to_string(cluster.next->id) + " is not the focus of a singleton cluster";
        }
    } else if (!ids.count(cluster.next->id)) {
        return "next " + std::to_string(cluster.next->id) + " is not among related";
    }
    return std::nullopt;
}

ClusterStats ClusterSelector::cluster_stats(const MessageCluster& cluster) const {
    ClusterStats stats;
    if (cluster.is_placeholder()) return stats;

    stats.total_messages = cluster.related.size() + 1;
    if (!cluster.related.empty()) {
        double sum = 0.0;
        stats.min_similarity = cluster.related.front().similarity;
        stats.max_similarity = cluster.related.front().similarity;
        for (const auto& r : cluster.related) {
            sum += r.similarity;
            stats.min_similarity = std::min(stats.min_similarity, r.similarity);
            stats.max_similarity = std::max(stats.max_similarity, r.similarity);
        }
        stats.avg_similarity = sum / static_cast<double>(cluster.related.size());
    }

    if (stats.total_messages < 2) return stats;

    // Diversity: mean of time spread (over 30 days) and length deviation (over 100 codepoints)
    std::vector<const Message*> all;
    all.push_back(&*cluster.focus);
    for (const auto& r : cluster.related) all.push_back(&r.message);

    int64_t earliest = to_epoch_ms(all.front()->created_at);
    int64_t latest = earliest;
    double length_sum = 0.0;
    std::vector<double> lengths;
    for (const Message* m : all) {
        int64_t t = to_epoch_ms(m->created_at);
        earliest = std::min(earliest, t);
        latest = std::max(latest, t);
        double len = static_cast<double>(util::codepoint_length(m->content));
        lengths.push_back(len);
        length_sum += len;
    }
    double mean = length_sum / static_cast<double>(lengths.size());
    double variance = 0.0;
    for (double len : lengths) variance += (len - mean) * (len - mean);
    variance /= static_cast<double>(lengths.size());

    double temporal_spread = std::min(1.0, static_cast<double>(latest - earliest) / kTemporalWindowMs);
    double length_spread = std::min(1.0, std::sqrt(variance) / 100.0);
    stats.diversity = (temporal_spread + length_spread) / 2.0;
    return stats;
}

} // namespace threnody
