#include "GenerationEngine.hpp"
#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include "TelgenErrors.hpp"
#include <iostream>

namespace {

constexpr int EXIT_COMPLETED = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_PARTIAL = 2;

void log_request(const ConfigData& config) {
    const auto& request = config.request;
    LogUtils::info("Generating {} rows per table from {} to {} ({} profile, fault ratio {})",
                   request.rows_per_table, TimestampUtils::format_datetime(request.range.start),
                   TimestampUtils::format_datetime(request.range.end), request.environment, request.fault_ratio);
    LogUtils::info("Output: {} ({}, compression {})", config.output.directory,
                   output_format_to_string(config.output.format), compression_to_string(config.output.compression));
}

}

int main(int argc, char* argv[]) {
    int result = EXIT_COMPLETED;

    LogUtils::init(LogUtils::Level::Info);

    try {
        ParameterContext context;
        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return EXIT_COMPLETED;
        }

        const ConfigData& config = context.get_config_data();
        if (config.global.log_dir != "log") {
            LogUtils::reopen(LogUtils::log_file_in(config.global.log_dir));
        }
        if (config.global.verbose) {
            LogUtils::set_level(LogUtils::Level::Debug);
        }
        log_request(config);

        GenerationEngine engine(config);
        GenerationSummary summary;
        {
            SignalManager::ScopedHandler signals(engine.stop_flag());
            summary = engine.run();
            if (int signum = SignalManager::last_signal()) {
                LogUtils::warn("Stopped by signal {}", signum);
            }
        }

        LogUtils::info("Seed {}: {} rows written", summary.seed, summary.total_rows());
        if (summary.all_completed()) {
            LogUtils::info("All tables completed successfully!");
        } else {
            LogUtils::warn("Output is partial{}", summary.any_cancelled() ? " (cancelled)" : "");
            result = EXIT_PARTIAL;
        }
    } catch (const ConfigurationError& e) {
        LogUtils::error("Invalid configuration ({}): {}", e.field(), e.what());
        LogUtils::error("Use --help or -? to show usage information");
        result = EXIT_FATAL;
    } catch (const SchemaViolationError& e) {
        LogUtils::error("Generation aborted: {}", e.what());
        result = EXIT_FATAL;
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        result = EXIT_FATAL;
    }

    LogUtils::shutdown();
    return result;
}
