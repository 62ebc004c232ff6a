#include "threnody/store_gateway.hpp"
#include "threnody/error.hpp"
#include "threnody/logging.hpp"
#include "threnody/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace threnody {

StoreGateway::StoreGateway(std::shared_ptr<MessageStore> store, const RetryConfig& retry)
    : StoreGateway(std::move(store), retry,
                   [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

StoreGateway::StoreGateway(std::shared_ptr<MessageStore> store, const RetryConfig& retry, Sleeper sleeper)
    : store_(std::move(store)), retry_(retry), sleeper_(std::move(sleeper)) {
    THRENODY_CHECK_ARGUMENT(store_ != nullptr, "StoreGateway requires a store");
    THRENODY_CHECK_ARGUMENT(retry_.max_attempts >= 1, "retry.max_attempts must be at least 1");
}

std::chrono::milliseconds StoreGateway::backoff_delay(uint32_t attempt) const {
    double delay = retry_.base_delay_ms * std::pow(retry_.multiplier, attempt > 0 ? attempt - 1 : 0);
    delay = std::min(delay, static_cast<double>(retry_.max_delay_ms));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

template <typename Fn>
auto StoreGateway::with_retry(const char* op, Fn&& fn) -> decltype(fn()) {
    for (uint32_t attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const StoreUnavailableError& e) {
            if (attempt >= retry_.max_attempts) {
                Metrics::getInstance().increment_counter("store_failures");
                LOG_ERROR("[STORE] " + std::string(op) + " failed after " +
                          std::to_string(attempt) + " attempts: " + e.what());
                throw StoreUnavailableError(std::string(op) + " unavailable after " +
                                                std::to_string(attempt) + " attempts",
                                            e.what(),
                                            "The engine keeps running and retries on the next tick");
            }
            auto delay = backoff_delay(attempt);
            Metrics::getInstance().increment_counter("store_retries");
            LOG_WARNING("[STORE] " + std::string(op) + " attempt " + std::to_string(attempt) +
                        " failed, retrying in " + std::to_string(delay.count()) + "ms");
            sleeper_(delay);
        }
    }
}

std::vector<Message> StoreGateway::range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) {
    if (limit == 0) return {};
    auto rows = with_retry("range_backward", [&] {
        return store_->range_backward(from_id, limit, ceiling_id);
    });

    MessageId upper = std::min(from_id, ceiling_id);
    rows.erase(std::remove_if(rows.begin(), rows.end(), [upper](const Message& m) {
                   return !m.is_visible() || m.id > upper;
               }),
               rows.end());
    std::sort(rows.begin(), rows.end(), [](const Message& a, const Message& b) { return a.id > b.id; });
    rows.erase(std::unique(rows.begin(), rows.end(),
                           [](const Message& a, const Message& b) { return a.id == b.id; }),
               rows.end());
    if (rows.size() > limit) {
        rows.resize(limit);
    }
    return rows;
}

std::vector<Message> StoreGateway::above(MessageId watermark) {
    auto rows = with_retry("above", [&] { return store_->above(watermark); });

    rows.erase(std::remove_if(rows.begin(), rows.end(), [watermark](const Message& m) {
                   return !m.is_visible() || m.id <= watermark;
               }),
               rows.end());
    std::sort(rows.begin(), rows.end(), [](const Message& a, const Message& b) { return a.id < b.id; });
    rows.erase(std::unique(rows.begin(), rows.end(),
                           [](const Message& a, const Message& b) { return a.id == b.id; }),
               rows.end());
    return rows;
}

MessageId StoreGateway::max_id() {
    MessageId id = with_retry("max_id", [&] { return store_->max_id(); });
    return std::max<MessageId>(id, 0);
}

int64_t StoreGateway::count() {
    return with_retry("count", [&] { return store_->count(); });
}

Message StoreGateway::insert(const std::string& content, bool approved) {
    Message msg = store_->insert(content, approved);
    LOG_INFO("[STORE] Inserted message " + std::to_string(msg.id) +
             (approved ? "" : " (awaiting approval)"));
    return msg;
}

bool StoreGateway::health_check() {
    try {
        with_retry("ping", [&] {
            store_->ping();
            return true;
        });
        return true;
    } catch (const ThrenodyException& e) {
        LOG_WARNING("[STORE] Health check failed: " + std::string(e.what()));
        return false;
    }
}

} // namespace threnody
