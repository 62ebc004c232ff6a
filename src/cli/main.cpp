// =============================================================================
// threnody CLI
// =============================================================================
//
// Usage:
//   threnody [global options] <command> [options]
//
// Commands:
//   run         Run the traversal engine and stream events as JSON lines;
//               submissions are read from stdin, one {"content": ...} per line
//   submit      Validate and store a new message
//   stats       Show store statistics
//   simulate    Deterministic in-memory run with invariant checks
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   threnody -c config/threnody.yaml run
//   threnody run --memory 1000
//   threnody submit "Missing my grandmother today"
//   threnody simulate --messages 1000 --cycles 50 --seed 7
//
// =============================================================================

#include <csignal>
#include <cstring>
#include <iostream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include "threnody/config.hpp"
#include "threnody/error.hpp"
#include "threnody/event_codec.hpp"
#include "threnody/logging.hpp"
#include "threnody/metrics.hpp"
#include "threnody/similarity.hpp"
#include "threnody/simulation.hpp"
#include "threnody/store/memory_store.hpp"
#include "threnody/store/pg_message_store.hpp"
#include "threnody/store_gateway.hpp"
#include "threnody/traversal_coordinator.hpp"

namespace threnody::cli {
    int cmd_run(int argc, char* argv[]);
    int cmd_submit(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_simulate(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#ifndef THRENODY_VERSION_STRING
#define THRENODY_VERSION_STRING "1.0.0"
#endif

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"run",      "Run the traversal engine and stream events as JSON lines", threnody::cli::cmd_run},
    {"submit",   "Validate and store a new message", threnody::cli::cmd_submit},
    {"stats",    "Show store statistics", threnody::cli::cmd_stats},
    {"simulate", "Deterministic in-memory run with invariant checks", threnody::cli::cmd_simulate},
    {"version",  "Show version information", threnody::cli::cmd_version},
    {"help",     "Show this help message", threnody::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

static threnody::Config load_cli_config() {
    threnody::Config config = threnody::load_config(g_options.config_file);

    threnody::LogLevel level = threnody::parse_log_level(config.logging.level);
    if (g_options.verbose) level = threnody::LogLevel::DEBUG;
    if (g_options.quiet) level = threnody::LogLevel::WARNING;
    threnody::Logger::getInstance()->configure(level, config.logging.file);
    return config;
}

static std::shared_ptr<threnody::StoreGateway> open_pg_gateway(const threnody::Config& config) {
    auto store = std::make_shared<threnody::PgMessageStore>(config.database);
    return std::make_shared<threnody::StoreGateway>(store, config.retry);
}

// Reads {"content": ...} lines from stdin on the io_context and answers each
// with a submitted or submit_error event on stdout
class SubmissionReader {
public:
    SubmissionReader(boost::asio::io_context& io, threnody::TraversalCoordinator& coordinator)
        : input_(io), coordinator_(coordinator) {}

    bool start() {
        int fd = ::dup(STDIN_FILENO);
        if (fd < 0) {
            LOG_WARNING("[CLI] stdin unavailable, submissions disabled");
            return false;
        }
        boost::system::error_code ec;
        input_.assign(fd, ec);
        if (ec) {
            // Regular files and /dev/null cannot be watched by the reactor
            ::close(fd);
            LOG_WARNING("[CLI] stdin cannot be read asynchronously (" + ec.message() + "), submissions disabled");
            return false;
        }
        read_next();
        return true;
    }

    void stop() {
        boost::system::error_code ec;
        input_.close(ec);
    }

private:
    void read_next() {
        boost::asio::async_read_until(input_, buffer_, '\n',
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        LOG_INFO("[CLI] Submission input closed: " + ec.message());
                    }
                    return;
                }
                std::istream in(&buffer_);
                std::string line;
                std::getline(in, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) {
                    std::cout << threnody::handle_submission_line(coordinator_, line) << std::endl;
                }
                read_next();
            });
    }

    boost::asio::posix::stream_descriptor input_;
    boost::asio::streambuf buffer_;
    threnody::TraversalCoordinator& coordinator_;
};

namespace threnody::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "threnody - traversal and clustering engine for grief messages\n";
    std::cout << "Version " << THRENODY_VERSION_STRING << "\n\n";
    std::cout << "Usage: threnody [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     YAML configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only warnings and errors\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  THRENODY_DB_NAME, THRENODY_DB_HOST, THRENODY_DB_PORT,\n";
    std::cout << "  THRENODY_DB_USER, THRENODY_DB_PASS   PostgreSQL connection\n";
    std::cout << "\nExamples:\n";
    std::cout << "  threnody -c config/threnody.yaml run\n";
    std::cout << "  threnody run --memory 1000\n";
    std::cout << "  echo '{\"content\": \"for mum\"}' | threnody run --memory 1000\n";
    std::cout << "  threnody submit \"Missing my grandmother today\"\n";
    std::cout << "  threnody simulate --messages 1000 --cycles 50\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "threnody " << THRENODY_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Run Command
// =============================================================================

int cmd_run(int argc, char* argv[]) {
    size_t memory_messages = 0;
    uint32_t seed = 42;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--memory" && i + 1 < argc) {
            memory_messages = std::stoul(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else {
            std::cerr << "Usage: threnody run [--memory N] [--seed S]\n";
            return 1;
        }
    }

    Config config = load_cli_config();

    std::shared_ptr<StoreGateway> gateway;
    if (memory_messages > 0) {
        auto store = std::make_shared<MemoryMessageStore>();
        seed_store(*store, memory_messages, seed);
        gateway = std::make_shared<StoreGateway>(store, config.retry);
        LOG_INFO("[CLI] Using in-memory store with " + std::to_string(memory_messages) + " messages");
    } else {
        gateway = open_pg_gateway(config);
    }

    boost::asio::io_context io;
    TraversalCoordinator coordinator(io, gateway, config.engine, config.intake);

    coordinator.on_working_set_changed([](const WorkingSetChange& change) {
        std::cout << encode_event(change) << std::endl;
    });
    coordinator.on_cluster_changed([](const MessageCluster& cluster) {
        std::cout << encode_event(cluster) << std::endl;
    });

    SubmissionReader reader(io, coordinator);
    std::optional<CoordinatorStats> final_stats;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) return;
        LOG_INFO("[CLI] Signal " + std::to_string(signal) + " received, shutting down");
        // stop() empties the pool, so the final stats are taken first
        final_stats = coordinator.get_stats();
        reader.stop();
        coordinator.stop();
        io.stop();
    });

    coordinator.initialize();
    reader.start();
    io.run();

    if (!final_stats) final_stats = coordinator.get_stats();
    std::cout << encode_event(*final_stats) << std::endl;
    LOG_DEBUG("[CLI] Final metrics:\n" + Metrics::getInstance().export_prometheus());
    return 0;
}

// =============================================================================
// Submit Command
// =============================================================================

int cmd_submit(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: threnody submit \"<text>\"\n";
        return 1;
    }

    Config config = load_cli_config();
    std::string content = validate_content(argv[0]);

    auto gateway = open_pg_gateway(config);
    Message message = gateway->insert(content, config.intake.auto_approve);
    std::cout << boost::json::serialize(message_to_json(message)) << "\n";
    return 0;
}

// =============================================================================
// Stats Command
// =============================================================================

int cmd_stats([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config config = load_cli_config();
    auto gateway = open_pg_gateway(config);

    if (!gateway->health_check()) {
        std::cerr << "Store unreachable (" << config.database.host << ":" << config.database.port << ")\n";
        return 1;
    }

    int64_t count = gateway->count();
    MessageId max_id = gateway->max_id();

    std::cout << "\n=== threnody store ===\n\n";
    std::cout << "  Database:            " << config.database.dbname << "@" << config.database.host << "\n";
    std::cout << "  Visible messages:    " << count << "\n";
    std::cout << "  Highest id:          " << max_id << "\n";
    std::cout << "  Working set target:  " << config.engine.working_set_size << "\n";
    if (count < static_cast<int64_t>(config.engine.working_set_size)) {
        std::cout << "  (store holds fewer messages than the working set target)\n";
    }
    return 0;
}

// =============================================================================
// Simulate Command
// =============================================================================

int cmd_simulate(int argc, char* argv[]) {
    SimulationOptions options;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--messages" && i + 1 < argc) {
            options.messages = std::stoul(argv[++i]);
        } else if (arg == "--cycles" && i + 1 < argc) {
            options.cycles = std::stoul(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--submit-every" && i + 1 < argc) {
            options.submit_every = std::stoul(argv[++i]);
        } else {
            std::cerr << "Usage: threnody simulate [--messages N] [--cycles K] [--seed S] [--submit-every C]\n";
            return 1;
        }
    }

    Config config = load_cli_config();
    options.engine = config.engine;

    SimulationReport report = run_simulation(options);

    std::cout << "\n=== Simulation ===\n\n";
    std::cout << "  Messages:            " << options.messages << "\n";
    std::cout << "  Cycles:              " << report.cycles_run << "\n";
    std::cout << "  Clusters emitted:    " << report.clusters_emitted << "\n";
    std::cout << "  Working set:         " << report.min_working_set << ".." << report.max_working_set << "\n";
    std::cout << "  Max queue depth:     " << report.max_queue_depth << "\n";
    std::cout << "  Dropped from queue:  " << report.dropped_total << "\n";

    if (!report.submissions.empty()) {
        std::cout << "\nSubmissions:\n";
        for (const auto& trace : report.submissions) {
            std::cout << "  #" << trace.id << " submitted before cycle " << trace.submitted_at_cycle;
            if (trace.featured_at_cycle >= 0) {
                std::cout << ", featured in cluster " << trace.featured_at_cycle << "\n";
            } else {
                std::cout << ", not featured\n";
            }
        }
    }

    if (report.ok()) {
        std::cout << "\nAll invariants held.\n";
        return 0;
    }
    std::cout << "\nInvariant violations:\n";
    for (const auto& violation : report.violations) {
        std::cout << "  " << violation << "\n";
    }
    return 1;
}

}  // namespace threnody::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        threnody::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const threnody::ThrenodyException& e) {
                std::cerr << e.what() << "\n";
                return 2;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'threnody help' for usage.\n";
    return 1;
}
