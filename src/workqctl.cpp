#include "workq/config.hpp"
#include "workq/errors.hpp"
#include "workq/logging.hpp"
#include "workq/pg_queue_store.hpp"
#include "workq/queue_manager.hpp"
#include "workq/util/parse.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [args]\n"
              << "Commands:\n"
              << "  init                                   Create schema and tables\n"
              << "  health                                 Check database connectivity\n"
              << "  enqueue <queue> <type> <body> [--priority N] [--max-retries N]\n"
              << "          [--delay SECONDS] [--correlation-id ID]\n"
              << "  claim <queue> [--type TYPE] [--claimant ID]\n"
              << "  complete <queue> <id> ok|fail [error]\n"
              << "  find <queue> <id>\n"
              << "  stats <queue> [--window-minutes M]\n"
              << "  dead-letters <queue> [--limit N]\n"
              << "  requeue <queue> <dead_letter_id>\n"
              << "  reclaim <queue> <seconds>\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD   PostgreSQL connection\n"
              << "  WORKQ_BACKOFF_BASE_SECONDS   Retry backoff base (default: 60)\n"
              << "  WORKQ_DEFAULT_MAX_RETRIES    Retries before dead-lettering (default: 3)\n"
              << "  WORKER_ID                    Claimant id when --claimant is omitted\n"
              << "  LOG_LEVEL                    trace|debug|info|warn|error|off (default: info)\n"
              << std::endl;
}

using workq::util::parse_int;

constexpr int64_t INT_MAX_VALUE = std::numeric_limits<int>::max();
constexpr int64_t INT_MIN_VALUE = std::numeric_limits<int>::min();
// Ten years, the same horizon retry backoff saturates at
constexpr int64_t MAX_DELAY_SECONDS = 10LL * 365 * 24 * 3600;

// Splits argv into positionals and --flag value pairs
struct Args {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> flags;

    std::optional<std::string> flag(const std::string& name) const {
        for (const auto& [key, value] : flags) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

    const std::string& at(size_t index, const std::string& what) const {
        if (index >= positional.size()) {
            throw workq::ValidationError("Missing argument: " + what);
        }
        return positional[index];
    }
};

Args parse_args(int argc, char* argv[], int first) {
    Args args;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw workq::ValidationError("Missing value for " + arg);
            }
            args.flags.emplace_back(arg, argv[++i]);
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

void check_flags(const Args& args, const std::vector<std::string>& allowed) {
    for (const auto& [key, value] : args.flags) {
        bool known = false;
        for (const auto& name : allowed) {
            if (key == name) known = true;
        }
        if (!known) {
            throw workq::ValidationError("Unknown option: " + key);
        }
    }
}

nlohmann::json run_command(workq::QueueManager& manager, const std::string& command, const Args& args) {
    if (command == "init") {
        manager.initialize_schema();
        return {{"initialized", true}};
    }

    if (command == "health") {
        bool healthy = manager.health_check();
        return {{"status", healthy ? "healthy" : "unhealthy"}, {"database", healthy ? "connected" : "disconnected"}};
    }

    if (command == "enqueue") {
        check_flags(args, {"--priority", "--max-retries", "--delay", "--correlation-id"});
        workq::EnqueueOptions options;
        if (auto v = args.flag("--priority")) {
            options.priority = static_cast<int>(parse_int(*v, "priority", INT_MIN_VALUE, INT_MAX_VALUE));
        }
        if (auto v = args.flag("--max-retries")) {
            options.max_retries = static_cast<int>(parse_int(*v, "max-retries", 0, INT_MAX_VALUE));
        }
        if (auto v = args.flag("--correlation-id")) options.correlation_id = *v;
        if (auto v = args.flag("--delay")) {
            auto delay = parse_int(*v, "delay", 0, MAX_DELAY_SECONDS);
            options.scheduled_at = workq::util::now() + std::chrono::seconds(delay);
        }
        int64_t id = manager.enqueue(args.at(0, "queue"), args.at(1, "type"), args.at(2, "body"), options);
        return {{"id", id}, {"queue", args.at(0, "queue")}};
    }

    if (command == "claim") {
        check_flags(args, {"--type", "--claimant"});
        auto message = manager.claim(args.at(0, "queue"), args.flag("--type"), args.flag("--claimant").value_or(""));
        return message ? message->to_json() : nlohmann::json(nullptr);
    }

    if (command == "complete") {
        check_flags(args, {});
        const std::string& outcome = args.at(2, "ok|fail");
        if (outcome != "ok" && outcome != "fail") {
            throw workq::ValidationError("Outcome must be 'ok' or 'fail', got '" + outcome + "'");
        }
        std::optional<std::string> error;
        if (args.positional.size() > 3) error = args.positional[3];
        auto result = manager.complete(args.at(0, "queue"), parse_int(args.at(1, "id"), "id"), outcome == "ok", error);
        return result.to_json();
    }

    if (command == "find") {
        check_flags(args, {});
        auto message = manager.find(args.at(0, "queue"), parse_int(args.at(1, "id"), "id"));
        return message ? message->to_json() : nlohmann::json(nullptr);
    }

    if (command == "stats") {
        check_flags(args, {"--window-minutes"});
        std::optional<std::chrono::minutes> window;
        if (auto v = args.flag("--window-minutes")) {
            window = std::chrono::minutes(parse_int(*v, "window-minutes", 1, INT_MAX_VALUE));
        }
        return manager.stats(args.at(0, "queue"), window).to_json();
    }

    if (command == "dead-letters") {
        check_flags(args, {"--limit"});
        size_t limit = 100;
        if (auto v = args.flag("--limit")) {
            limit = static_cast<size_t>(parse_int(*v, "limit", 1, INT_MAX_VALUE));
        }
        nlohmann::json records = nlohmann::json::array();
        for (const auto& record : manager.dead_letters(args.at(0, "queue"), limit)) {
            records.push_back(record.to_json());
        }
        return records;
    }

    if (command == "requeue") {
        check_flags(args, {});
        int64_t dead_letter_id = parse_int(args.at(1, "dead_letter_id"), "dead_letter_id");
        int64_t id = manager.requeue_dead_letter(args.at(0, "queue"), dead_letter_id);
        return {{"id", id}, {"deadLetterId", dead_letter_id}};
    }

    if (command == "reclaim") {
        check_flags(args, {});
        auto seconds = parse_int(args.at(1, "seconds"), "seconds", 0, MAX_DELAY_SECONDS);
        size_t reclaimed = manager.reclaim_stale(args.at(0, "queue"), std::chrono::seconds(seconds));
        return {{"reclaimed", reclaimed}};
    }

    throw workq::ValidationError("Unknown command: " + command);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    // stdout carries the JSON result
    spdlog::set_default_logger(spdlog::stderr_color_mt("workqctl"));

    workq::Config config = workq::Config::load();
    workq::configure_logging(config.logging);

    try {
        Args args = parse_args(argc, argv, 2);

        auto pool = workq::PgQueueStore::make_pool(config.database);
        auto store = std::make_shared<workq::PgQueueStore>(pool);
        workq::QueueManager manager(store, config.queue);

        std::cout << run_command(manager, command, args).dump(2) << std::endl;

    } catch (const workq::StorageError& e) {
        spdlog::error("Storage error: {}", e.what());
        return 2;
    } catch (const workq::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
