// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "threnody/config.hpp"
#include "threnody/error.hpp"

using namespace threnody;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_config_path_ = (std::filesystem::temp_directory_path() / "threnody_test_config.yaml").string();
        unsetenv("THRENODY_DB_NAME");
        unsetenv("THRENODY_DB_HOST");
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_config_path_)) {
            std::filesystem::remove(temp_config_path_);
        }
        unsetenv("THRENODY_DB_NAME");
        unsetenv("THRENODY_DB_HOST");
    }

    void write_config(const std::string& body) {
        std::ofstream config_file(temp_config_path_);
        config_file << body;
    }

    std::string temp_config_path_;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config config = load_config();

    EXPECT_EQ(config.engine.working_set_size, 400u);
    EXPECT_EQ(config.engine.cluster_size, 20u);
    EXPECT_EQ(config.engine.cluster_duration_ms, 8000u);
    EXPECT_EQ(config.engine.polling_interval_ms, 5000u);
    EXPECT_EQ(config.engine.priority_queue_max_size, 200u);
    EXPECT_DOUBLE_EQ(config.engine.similarity.temporal_weight, 0.6);
    EXPECT_DOUBLE_EQ(config.engine.similarity.length_weight, 0.2);
    EXPECT_DOUBLE_EQ(config.engine.similarity.semantic_weight, 0.2);
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.database.dbname, "threnody");
    EXPECT_TRUE(config.intake.auto_approve);
}

TEST_F(ConfigTest, YamlOverlaysDefaults) {
    write_config(R"(
engine:
  working_set_size: 100
  cluster_size: 10
  cluster_duration_ms: 2000

similarity:
  temporal_weight: 0.5
  length_weight: 0.3
  semantic_weight: 0.2

database:
  host: "db.internal"
  port: "6543"

logging:
  level: "debug"

intake:
  auto_approve: false
)");

    Config config = load_config(temp_config_path_);

    EXPECT_EQ(config.engine.working_set_size, 100u);
    EXPECT_EQ(config.engine.cluster_size, 10u);
    EXPECT_EQ(config.engine.cluster_duration_ms, 2000u);
    EXPECT_EQ(config.engine.polling_interval_ms, 5000u);  // untouched
    EXPECT_DOUBLE_EQ(config.engine.similarity.temporal_weight, 0.5);
    EXPECT_EQ(config.database.host, "db.internal");
    EXPECT_EQ(config.database.port, "6543");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.intake.auto_approve);
    EXPECT_EQ(config.config_file, temp_config_path_);
}

TEST_F(ConfigTest, EnvironmentSuppliesDatabase) {
    setenv("THRENODY_DB_NAME", "grief", 1);
    setenv("THRENODY_DB_HOST", "10.0.0.7", 1);

    Config config = load_config();

    EXPECT_EQ(config.database.dbname, "grief");
    EXPECT_EQ(config.database.host, "10.0.0.7");
}

TEST_F(ConfigTest, YamlWinsOverEnvironment) {
    setenv("THRENODY_DB_HOST", "from-env", 1);
    write_config("database:\n  host: \"from-yaml\"\n");

    Config config = load_config(temp_config_path_);
    EXPECT_EQ(config.database.host, "from-yaml");
}

TEST_F(ConfigTest, ConninfoIncludesCredentials) {
    DatabaseConfig db;
    db.dbname = "threnody";
    db.host = "localhost";
    db.port = "5432";
    db.user = "app";
    db.password = "secret";
    db.connect_timeout_s = 3;

    std::string conninfo = db.to_conninfo();
    EXPECT_NE(conninfo.find("dbname=threnody"), std::string::npos);
    EXPECT_NE(conninfo.find("user=app"), std::string::npos);
    EXPECT_NE(conninfo.find("password=secret"), std::string::npos);
    EXPECT_NE(conninfo.find("connect_timeout=3"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/threnody.yaml"), ConfigError);
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    write_config("engine: [unterminated\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    write_config("engine:\n  working_set_size: lots\n");
    EXPECT_THROW(load_config(temp_config_path_), ConfigError);
}

TEST_F(ConfigTest, WeightsMustSumToOne) {
    write_config(R"(
similarity:
  temporal_weight: 0.6
  length_weight: 0.4
  semantic_weight: 0.2
)");

    try {
        load_config(temp_config_path_);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_INVALID);
        EXPECT_NE(std::string(e.what()).find("sum"), std::string::npos);
    }
}

TEST_F(ConfigTest, ClusterLargerThanWorkingSetRejected) {
    Config config;
    config.engine.working_set_size = 10;
    config.engine.cluster_size = 11;
    EXPECT_THROW(validate_config(config), ConfigError);
}

TEST_F(ConfigTest, ReportsEveryViolation) {
    Config config;
    config.engine.cluster_duration_ms = 1;
    config.engine.priority_queue_max_size = 0;

    try {
        validate_config(config);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("engine.cluster_duration_ms"), std::string::npos);
        EXPECT_NE(message.find("engine.priority_queue_max_size"), std::string::npos);
    }
}

TEST_F(ConfigTest, RetryDelaysMustBeOrdered) {
    Config config;
    config.retry.base_delay_ms = 1000;
    config.retry.max_delay_ms = 500;
    EXPECT_THROW(validate_config(config), ConfigError);
}
