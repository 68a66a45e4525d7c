#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include "lifecycle_ngin/core/config_loader.hpp"
#include "lifecycle_ngin/core/logger.hpp"
#include "lifecycle_ngin/core/state_manager.hpp"
#include "lifecycle_ngin/data/postgres_connection.hpp"
#include "lifecycle_ngin/data/postgres_market_data.hpp"
#include "lifecycle_ngin/data/postgres_phase_provider.hpp"
#include "lifecycle_ngin/execution/paper_order_executor.hpp"
#include "lifecycle_ngin/orchestrator/decision_orchestrator.hpp"
#include "lifecycle_ngin/position/postgres_position_store.hpp"
#include "lifecycle_ngin/risk/risk_scorer.hpp"
#include "lifecycle_ngin/storage/async_audit_sink.hpp"
#include "lifecycle_ngin/storage/file_audit_writer.hpp"
#include "lifecycle_ngin/storage/postgres_audit_writer.hpp"
#include "lifecycle_ngin/trend/trend_engine_runner.hpp"

using namespace lifecycle_ngin;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " --timeframe <1m|15m|1h|4h> [--mode engine|decide|all]"
                 " [--config <dir>] [--profile <name>] [--dry-run]"
              << std::endl;
    std::cerr << "Example: " << program << " --timeframe 1h --mode all --profile paper"
              << std::endl;
}

int run_engine(const AppConfig& config, Timeframe timeframe,
               std::shared_ptr<PositionStore> store,
               std::shared_ptr<PostgresConnection> connection) {
    auto market_data = std::make_shared<PostgresMarketData>(connection);
    TrendEngineRunner runner(store, market_data, config.trend);

    auto result = runner.run(timeframe);
    if (result.is_error()) {
        ERROR("Trend engine run failed: " << result.error()->what());
        return 1;
    }
    const auto& summary = result.value();
    INFO("Trend engine " << timeframe_to_string(timeframe) << ": evaluated=" << summary.evaluated
                         << ", bootstrapped=" << summary.bootstrapped
                         << ", state_changes=" << summary.state_changes
                         << ", skipped=" << summary.skipped << ", failed=" << summary.failed);
    return summary.failed == 0 ? 0 : 2;
}

int run_decisions(const AppConfig& config, Timeframe timeframe,
                  std::shared_ptr<PositionStore> store,
                  std::shared_ptr<PostgresConnection> connection) {
    std::shared_ptr<AuditWriter> writer;
    if (config.audit.destination == "file") {
        writer = std::make_shared<FileAuditWriter>(config.audit.file_path);
    } else {
        writer = std::make_shared<PostgresAuditWriter>(connection);
    }
    auto audit_sink = std::make_shared<AsyncAuditSink>(writer, config.audit.max_queue_size);

    auto phase_provider = std::make_shared<PostgresPhaseProvider>(connection);
    auto scorer = std::make_shared<RiskScorer>(phase_provider, config.risk);
    DecisionPolicy policy(PositionSizer(config.sizing),
                          config.orchestrator.max_output_age(timeframe));
    auto executor = std::make_shared<PaperOrderExecutor>(config.paper_executor);

    DecisionOrchestrator orchestrator(config.orchestrator, store, scorer, std::move(policy),
                                      executor, audit_sink);

    auto result = orchestrator.run_tick(timeframe);
    audit_sink->stop();

    if (result.is_error()) {
        ERROR("Decision tick failed: " << result.error()->what());
        return 1;
    }
    const auto& summary = result.value();
    INFO("Decision tick " << timeframe_to_string(timeframe) << ": evaluated=" << summary.evaluated
                          << ", executed=" << summary.executed << ", holds=" << summary.holds
                          << ", dry_run=" << summary.dry_run
                          << ", skipped_duplicate=" << summary.skipped_duplicate
                          << ", failed=" << summary.failed << ", promoted=" << summary.promoted
                          << ", demoted=" << summary.demoted);
    if (audit_sink->dropped() > 0 || audit_sink->write_failures() > 0) {
        WARN("Audit sink lost records: dropped=" << audit_sink->dropped()
                                                 << ", write_failures="
                                                 << audit_sink->write_failures());
    }
    return summary.failed == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string timeframe_label;
        std::string mode = "all";
        std::string config_dir = "./config";
        std::string profile;
        bool force_dry_run = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next_value = [&](std::string& target) {
                if (i + 1 >= argc) {
                    return false;
                }
                target = argv[++i];
                return true;
            };

            bool ok = true;
            if (arg == "--timeframe") {
                ok = next_value(timeframe_label);
            } else if (arg == "--mode") {
                ok = next_value(mode);
            } else if (arg == "--config") {
                ok = next_value(config_dir);
            } else if (arg == "--profile") {
                ok = next_value(profile);
            } else if (arg == "--dry-run") {
                force_dry_run = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                ok = false;
            }

            if (!ok) {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        auto timeframe = timeframe_from_string(timeframe_label);
        if (!timeframe) {
            std::cerr << "Unknown or missing timeframe: '" << timeframe_label << "'" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        if (mode != "engine" && mode != "decide" && mode != "all") {
            std::cerr << "Unknown mode: " << mode << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        auto config_result = ConfigLoader::load(config_dir, profile);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->what()
                      << std::endl;
            return 1;
        }
        AppConfig config = config_result.take_value();
        if (force_dry_run) {
            config.orchestrator.dry_run = true;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("LifecycleTick");
        INFO("Starting lifecycle tick: timeframe=" << timeframe_label << ", mode=" << mode
                                                   << ", dry_run="
                                                   << (config.orchestrator.dry_run ? "true"
                                                                                   : "false"));

        auto connection =
            std::make_shared<PostgresConnection>(config.database.get_connection_string());
        auto connect_result = connection->connect();
        if (connect_result.is_error()) {
            ERROR("Failed to connect to database: " << connect_result.error()->what());
            return 1;
        }
        auto store = std::make_shared<PostgresPositionStore>(connection);

        int exit_code = 0;
        if (mode == "engine" || mode == "all") {
            exit_code = run_engine(config, *timeframe, store, connection);
            if (exit_code == 1) {
                return exit_code;
            }
        }
        if (mode == "decide" || mode == "all") {
            int decide_code = run_decisions(config, *timeframe, store, connection);
            exit_code = std::max(exit_code, decide_code);
        }

        INFO("Lifecycle tick finished with exit code " << exit_code);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
