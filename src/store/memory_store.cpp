#include "threnody/store/memory_store.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <random>

namespace threnody {

std::vector<Message> MemoryMessageStore::range_backward(MessageId from_id, size_t limit, MessageId ceiling_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result;
    if (limit == 0) return result;

    MessageId upper = std::min(from_id, ceiling_id);
    auto it = rows_.upper_bound(upper);
    while (it != rows_.begin() && result.size() < limit) {
        --it;
        if (it->second.is_visible()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<Message> MemoryMessageStore::above(MessageId watermark) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result;
    for (auto it = rows_.upper_bound(watermark); it != rows_.end(); ++it) {
        if (it->second.is_visible()) {
            result.push_back(it->second);
        }
    }
    return result;
}

MessageId MemoryMessageStore::max_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = rows_.rbegin(); it != rows_.rend(); ++it) {
        if (it->second.is_visible()) return it->first;
    }
    return 0;
}

int64_t MemoryMessageStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t total = 0;
    for (const auto& [id, row] : rows_) {
        if (row.is_visible()) ++total;
    }
    return total;
}

Message MemoryMessageStore::insert(const std::string& content, bool approved) {
    return insert_at(content, Clock::now(), approved);
}

Message MemoryMessageStore::insert_at(const std::string& content, Timestamp created_at, bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);
    Message msg;
    msg.id = next_id_++;
    msg.content = content;
    msg.created_at = created_at;
    msg.approved = approved;
    rows_.emplace(msg.id, msg);
    return msg;
}

void MemoryMessageStore::ping() {}

bool MemoryMessageStore::soft_delete(MessageId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return false;
    it->second.deleted_at = Clock::now();
    return true;
}

bool MemoryMessageStore::set_approved(MessageId id, bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return false;
    it->second.approved = approved;
    return true;
}

size_t MemoryMessageStore::row_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

void seed_store(MemoryMessageStore& store, size_t count, uint32_t seed) {
    static const char* const templates[] = {
        "Missing my %s every day",
        "Still can't believe %s is gone",
        "The silence where %s used to be",
        "Grieving the loss of %s",
        "Some days the absence of %s is overwhelming",
        "Learning to live without %s",
        "The world feels emptier without %s",
        "Carrying the memory of %s",
    };
    static const char* const subjects[] = {
        "my dog", "my cat", "my father", "my mother", "my friend",
        "my grandmother", "my career", "my home", "my marriage",
        "the person I used to be", "my health", "my dreams",
    };

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int64_t> age_ms(0, static_cast<int64_t>(30) * 24 * 60 * 60 * 1000);

    // Ascending creation times so that id order matches time order
    std::vector<int64_t> ages(count);
    for (auto& age : ages) age = age_ms(rng);
    std::sort(ages.begin(), ages.end(), std::greater<int64_t>());

    Timestamp now = Clock::now();
    for (size_t i = 0; i < count; ++i) {
        const char* tmpl = templates[rng() % (sizeof(templates) / sizeof(templates[0]))];
        const char* subject = subjects[rng() % (sizeof(subjects) / sizeof(subjects[0]))];
        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), tmpl, subject);
        store.insert_at(buffer, now - std::chrono::milliseconds(ages[i]), true);
    }
}

} // namespace threnody
