#include "threnody/similarity.hpp"
#include "threnody/error.hpp"
#include "threnody/util/utf8.hpp"

#include <algorithm>
#include <cmath>

namespace threnody {

double temporal_proximity(const Message& a, const Message& b) {
    double delta = std::fabs(static_cast<double>(to_epoch_ms(a.created_at) - to_epoch_ms(b.created_at)));
    return std::max(0.0, 1.0 - delta / kTemporalWindowMs);
}

double length_similarity(const Message& a, const Message& b) {
    double la = static_cast<double>(util::codepoint_length(a.content));
    double lb = static_cast<double>(util::codepoint_length(b.content));
    double sim = 1.0 - std::fabs(la - lb) / static_cast<double>(kMaxContentLength);
    return std::clamp(sim, 0.0, 1.0);
}

double semantic_similarity(const Message&, const Message&) {
    return 0.0;
}

double similarity(const Message& a, const Message& b, const SimilarityConfig& weights) {
    return weights.temporal_weight * temporal_proximity(a, b)
         + weights.length_weight * length_similarity(a, b)
         + weights.semantic_weight * semantic_similarity(a, b);
}

std::string validate_content(const std::string& content) {
    std::string trimmed = util::trim(content);
    if (trimmed.empty()) {
        throw ValidationError("Message content is empty", __func__);
    }
    if (!util::is_valid_utf8(trimmed)) {
        throw ValidationError("Message content is not valid UTF-8", __func__);
    }
    size_t length = util::codepoint_length(trimmed);
    if (length > kMaxContentLength) {
        throw ValidationError("Message content exceeds " + std::to_string(kMaxContentLength) +
                              " characters (" + std::to_string(length) + ")", __func__);
    }
    return trimmed;
}

} // namespace threnody
