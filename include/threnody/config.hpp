#pragma once

#include <cstdint>
#include <string>

namespace threnody {

/**
 * Weights of the similarity score. The semantic term is reserved for a
 * future embedding comparison and currently contributes nothing, but its
 * weight still counts towards the required total of 1.0.
 */
struct SimilarityConfig {
    double temporal_weight = 0.6;
    double length_weight = 0.2;
    double semantic_weight = 0.2;
};

struct EngineConfig {
    uint32_t working_set_size = 400;
    uint32_t cluster_size = 20;
    uint32_t cluster_duration_ms = 8000;
    uint32_t polling_interval_ms = 5000;
    uint32_t priority_queue_max_size = 200;
    SimilarityConfig similarity;
};

// Capped exponential backoff for store reads
struct RetryConfig {
    uint32_t max_attempts = 5;
    uint32_t base_delay_ms = 200;
    double multiplier = 2.0;
    uint32_t max_delay_ms = 5000;
};

struct DatabaseConfig {
    std::string dbname = "threnody";
    std::string host = "localhost";
    std::string port = "5432";
    std::string user = "postgres";
    std::string password;
    uint32_t connect_timeout_s = 5;

    // Build libpq connection string
    std::string to_conninfo() const;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct IntakeConfig {
    bool auto_approve = true;
};

struct Config {
    EngineConfig engine;
    RetryConfig retry;
    DatabaseConfig database;
    LoggingConfig logging;
    IntakeConfig intake;
    std::string config_file;
};

// Defaults, overlaid by THRENODY_DB_* environment variables, overlaid by the
// YAML file when one is given. Throws ConfigError on unreadable YAML or on
// values outside their valid ranges.
Config load_config(const std::string& config_file = "");

// Throws ConfigError naming every violated range.
void validate_config(const Config& config);

} // namespace threnody
