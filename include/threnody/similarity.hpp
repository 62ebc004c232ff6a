#pragma once

#include "threnody/config.hpp"
#include "threnody/types.hpp"

#include <string>

namespace threnody {

// Window over which temporal proximity decays linearly to zero
constexpr double kTemporalWindowMs = 30.0 * 24 * 60 * 60 * 1000;

// max(0, 1 - |dt| / 30 days)
double temporal_proximity(const Message& a, const Message& b);

// 1 - |len(a) - len(b)| / 280, lengths in codepoints
double length_similarity(const Message& a, const Message& b);

// Placeholder for embedding comparison. Always 0 until an embedding source
// exists; the semantic weight is kept in the score so the weights still sum to 1.
double semantic_similarity(const Message& a, const Message& b);

// temporal_weight * temporal + length_weight * length + semantic_weight * semantic
double similarity(const Message& a, const Message& b, const SimilarityConfig& weights);

// Intake check: valid UTF-8 and 1..280 codepoints once surrounding whitespace
// is removed. Returns the trimmed content; throws ValidationError otherwise.
std::string validate_content(const std::string& content);

} // namespace threnody
