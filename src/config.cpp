#include "threnody/config.hpp"
#include "threnody/error.hpp"
#include "threnody/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace threnody {

namespace {

std::string get_env(const char* name, const std::string& def) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : def;
}

void load_database_from_env(DatabaseConfig& db) {
    db.dbname = get_env("THRENODY_DB_NAME", db.dbname);
    db.host = get_env("THRENODY_DB_HOST", db.host);
    db.port = get_env("THRENODY_DB_PORT", db.port);
    db.user = get_env("THRENODY_DB_USER", db.user);
    db.password = get_env("THRENODY_DB_PASS", db.password);
}

void load_from_yaml(Config& config, const YAML::Node& yaml) {
    if (yaml["engine"]) {
        const auto& engine = yaml["engine"];
        if (engine["working_set_size"]) config.engine.working_set_size = engine["working_set_size"].as<uint32_t>();
        if (engine["cluster_size"]) config.engine.cluster_size = engine["cluster_size"].as<uint32_t>();
        if (engine["cluster_duration_ms"]) config.engine.cluster_duration_ms = engine["cluster_duration_ms"].as<uint32_t>();
        if (engine["polling_interval_ms"]) config.engine.polling_interval_ms = engine["polling_interval_ms"].as<uint32_t>();
        if (engine["priority_queue_max_size"]) config.engine.priority_queue_max_size = engine["priority_queue_max_size"].as<uint32_t>();
    }

    if (yaml["similarity"]) {
        const auto& sim = yaml["similarity"];
        if (sim["temporal_weight"]) config.engine.similarity.temporal_weight = sim["temporal_weight"].as<double>();
        if (sim["length_weight"]) config.engine.similarity.length_weight = sim["length_weight"].as<double>();
        if (sim["semantic_weight"]) config.engine.similarity.semantic_weight = sim["semantic_weight"].as<double>();
    }

    if (yaml["retry"]) {
        const auto& retry = yaml["retry"];
        if (retry["max_attempts"]) config.retry.max_attempts = retry["max_attempts"].as<uint32_t>();
        if (retry["base_delay_ms"]) config.retry.base_delay_ms = retry["base_delay_ms"].as<uint32_t>();
        if (retry["multiplier"]) config.retry.multiplier = retry["multiplier"].as<double>();
        if (retry["max_delay_ms"]) config.retry.max_delay_ms = retry["max_delay_ms"].as<uint32_t>();
    }

    if (yaml["database"]) {
        const auto& db = yaml["database"];
        if (db["dbname"]) config.database.dbname = db["dbname"].as<std::string>();
        if (db["host"]) config.database.host = db["host"].as<std::string>();
        if (db["port"]) config.database.port = db["port"].as<std::string>();
        if (db["user"]) config.database.user = db["user"].as<std::string>();
        if (db["password"]) config.database.password = db["password"].as<std::string>();
        if (db["connect_timeout_s"]) config.database.connect_timeout_s = db["connect_timeout_s"].as<uint32_t>();
    }

    if (yaml["logging"]) {
        const auto& log = yaml["logging"];
        if (log["level"]) config.logging.level = log["level"].as<std::string>();
        if (log["file"]) config.logging.file = log["file"].as<std::string>();
    }

    if (yaml["intake"]) {
        const auto& intake = yaml["intake"];
        if (intake["auto_approve"]) config.intake.auto_approve = intake["auto_approve"].as<bool>();
    }
}

void check_range(std::vector<std::string>& errors, const char* name,
                 double value, double lo, double hi) {
    if (value < lo || value > hi) {
        errors.push_back(std::string(name) + "=" + std::to_string(value) +
                         " outside [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

} // namespace

std::string DatabaseConfig::to_conninfo() const {
    std::string conninfo = "dbname=" + dbname;
    if (!host.empty()) conninfo += " host=" + host;
    if (!port.empty()) conninfo += " port=" + port;
    if (!user.empty()) conninfo += " user=" + user;
    if (!password.empty()) conninfo += " password=" + password;
    conninfo += " connect_timeout=" + std::to_string(connect_timeout_s);
    return conninfo;
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    load_database_from_env(config.database);

    if (!config_file.empty()) {
        if (!std::filesystem::exists(config_file)) {
            throw ConfigError("Configuration file not found", config_file,
                              "Pass an existing YAML file or omit -c to run on defaults");
        }
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);
            load_from_yaml(config, yaml);
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Failed to parse configuration: ") + e.what(), config_file);
        }
    }

    validate_config(config);
    LOG_DEBUG("[CONFIG] Loaded configuration" +
              (config_file.empty() ? std::string(" (defaults)") : " from " + config_file));
    return config;
}

void validate_config(const Config& config) {
    std::vector<std::string> errors;
    const EngineConfig& e = config.engine;

    check_range(errors, "engine.working_set_size", e.working_set_size, 1, 10000);
    check_range(errors, "engine.cluster_size", e.cluster_size, 1, e.working_set_size);
    check_range(errors, "engine.cluster_duration_ms", e.cluster_duration_ms, 500, 600000);
    check_range(errors, "engine.polling_interval_ms", e.polling_interval_ms, 100, 600000);
    check_range(errors, "engine.priority_queue_max_size", e.priority_queue_max_size, 1, 100000);

    check_range(errors, "similarity.temporal_weight", e.similarity.temporal_weight, 0.0, 1.0);
    check_range(errors, "similarity.length_weight", e.similarity.length_weight, 0.0, 1.0);
    check_range(errors, "similarity.semantic_weight", e.similarity.semantic_weight, 0.0, 1.0);
    double total = e.similarity.temporal_weight + e.similarity.length_weight + e.similarity.semantic_weight;
    if (std::fabs(total - 1.0) > 1e-6) {
        errors.push_back("similarity weights sum to " + std::to_string(total) + ", expected 1.0");
    }

    check_range(errors, "retry.max_attempts", config.retry.max_attempts, 1, 20);
    check_range(errors, "retry.base_delay_ms", config.retry.base_delay_ms, 0, 60000);
    check_range(errors, "retry.multiplier", config.retry.multiplier, 1.0, 10.0);
    check_range(errors, "retry.max_delay_ms", config.retry.max_delay_ms, config.retry.base_delay_ms, 600000);

    if (!errors.empty()) {
        std::string message = "Invalid configuration:";
        for (const auto& err : errors) {
            message += "\n  " + err;
        }
        throw ConfigError(message, config.config_file);
    }
}

} // namespace threnody
