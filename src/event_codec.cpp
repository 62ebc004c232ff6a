#include "threnody/event_codec.hpp"
#include "threnody/error.hpp"

namespace threnody {

namespace {

boost::json::value optional_id(const std::optional<MessageId>& id) {
    if (id) return boost::json::value(*id);
    return nullptr;
}

boost::json::value optional_message(const std::optional<Message>& message) {
    if (message) return message_to_json(*message);
    return nullptr;
}

} // namespace

boost::json::object message_to_json(const Message& message) {
    boost::json::object obj;
    obj["id"] = message.id;
    obj["content"] = message.content;
    obj["created_at"] = to_epoch_ms(message.created_at);
    obj["approved"] = message.approved;
    return obj;
}

boost::json::object cluster_to_json(const MessageCluster& cluster) {
    boost::json::object obj;
    obj["placeholder"] = cluster.is_placeholder();
    obj["focus"] = optional_message(cluster.focus);

    boost::json::array related;
    for (const auto& r : cluster.related) {
        boost::json::object entry;
        entry["message"] = message_to_json(r.message);
        entry["similarity"] = r.similarity;
        related.push_back(std::move(entry));
    }
    obj["related"] = std::move(related);

    obj["next"] = optional_message(cluster.next);
    obj["duration_ms"] = cluster.duration_ms;
    obj["total_shown"] = cluster.total_shown;
    obj["timestamp"] = to_epoch_ms(cluster.timestamp);
    return obj;
}

boost::json::object working_set_change_to_json(const WorkingSetChange& change) {
    boost::json::object obj;
    obj["reason"] = change_reason_str(change.reason);

    boost::json::array removed;
    for (MessageId id : change.removed) {
        removed.push_back(id);
    }
    obj["removed"] = std::move(removed);

    boost::json::array added;
    for (const auto& msg : change.added) {
        added.push_back(message_to_json(msg));
    }
    obj["added"] = std::move(added);

    boost::json::array priority;
    for (MessageId id : change.priority_added) {
        priority.push_back(id);
    }
    obj["priority"] = std::move(priority);
    return obj;
}

boost::json::object stats_to_json(const CoordinatorStats& stats) {
    boost::json::object pool;
    pool["historical_cursor"] = optional_id(stats.pool.historical_cursor);
    pool["watermark"] = stats.pool.watermark;
    pool["queue_depth"] = stats.pool.queue_depth;
    pool["dropped_total"] = stats.pool.dropped_total;
    pool["estimated_queue_wait_ms"] = stats.pool.estimated_queue_wait_ms;

    boost::json::object obj;
    obj["state"] = coordinator_state_str(stats.state);
    obj["degraded"] = stats.degraded;
    obj["working_set_size"] = stats.working_set_size;
    obj["target_size"] = stats.target_size;
    obj["priority_members"] = stats.priority_members;
    obj["clusters_emitted"] = stats.clusters_emitted;
    obj["cycles_skipped"] = stats.cycles_skipped;
    obj["current_focus"] = optional_id(stats.current_focus);
    obj["current_next"] = optional_id(stats.current_next);
    obj["pool"] = std::move(pool);
    return obj;
}

std::string encode_event(const MessageCluster& cluster) {
    boost::json::object root;
    root["type"] = "cluster_changed";
    root["cluster"] = cluster_to_json(cluster);
    return boost::json::serialize(root);
}

std::string encode_event(const WorkingSetChange& change) {
    boost::json::object root = working_set_change_to_json(change);
    root["type"] = "working_set_changed";
    return boost::json::serialize(root);
}

std::string encode_event(const CoordinatorStats& stats) {
    boost::json::object root;
    root["type"] = "stats";
    root["stats"] = stats_to_json(stats);
    return boost::json::serialize(root);
}

std::string handle_submission_line(TraversalCoordinator& coordinator, const std::string& line) {
    boost::json::object root;
    try {
        boost::system::error_code ec;
        boost::json::value parsed = boost::json::parse(line, ec);
        if (ec) {
            throw ValidationError("Submission is not valid JSON: " + ec.message(), __func__);
        }
        const auto* content = parsed.is_object() ? parsed.as_object().if_contains("content") : nullptr;
        if (!content || !content->is_string()) {
            throw ValidationError("Submission needs a string \"content\" field", __func__);
        }

        Message message = coordinator.submit(std::string(content->as_string()));
        root["type"] = "submitted";
        root["message"] = message_to_json(message);
    } catch (const ThrenodyException& e) {
        root["type"] = "submit_error";
        root["code"] = static_cast<int>(e.code());
        root["error"] = e.what();
    }
    return boost::json::serialize(root);
}

} // namespace threnody
