/**
 * @file main.cpp
 * @brief logprof - Command-line interface
 *
 * Entry point for the log call-tree profiler. Loads the event configuration,
 * reconstructs per-thread call trees from a log file, prints the text report
 * and exports a Chrome/Perfetto trace.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "logprof/core/log_profiler.hpp"
#include "logprof/core/profiler_config.hpp"
#include "logprof/reporters/chrome_trace_reporter.hpp"
#include "logprof/reporters/text_reporter.hpp"
#include "logprof/utils/string_utils.hpp"

#include <iostream>
#include <filesystem>
#include <utility>

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintRunSummary(const logprof::core::ProcessStatus& status,
                     const logprof::core::LogProfiler& profiler) {
    const auto& stats = profiler.Engine().Stats();
    std::string source = logprof::utils::StringUtils::Truncate(status.source, 48);

    std::cout << "\n";
    std::cout << "[+] Source:  " << source << "\n";
    std::cout << "[+] Lines:   " << status.lines_read << " read, "
              << status.lines_parsed << " parsed, "
              << status.signals << " signals\n";
    std::cout << "[+] Trees:   " << stats.roots << " root(s)\n";
    if (stats.discarded_ends > 0) {
        std::cout << "[i] " << stats.discarded_ends << " unmatched end marker(s) ignored\n";
    }
    if (stats.forced_closures > 0) {
        std::cout << "[i] " << stats.forced_closures << " unterminated event(s) closed at end of log\n";
    }
    if (status.is_partial) {
        std::cout << "[!] Input was only partially read; results are incomplete\n";
    }
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"logprof - call-tree profiler for instrumented application logs"};

    std::string log_path = "dummy_log.txt";
    std::string config_path = "config.json";
    std::string output_path = "trace_result.json";
    bool verbose = false;
    bool quiet = false;
    bool no_trace = false;
    bool no_report = false;
    bool pretty = false;

    app.add_option("log", log_path, "Log file to analyze")
        ->default_val("dummy_log.txt");
    app.add_option("-c,--config", config_path, "Event configuration (JSON)")
        ->default_val("config.json");
    app.add_option("-o,--output", output_path, "Chrome trace output file")
        ->default_val("trace_result.json");

    app.add_flag("--no-trace", no_trace, "Do not write the Chrome trace file");
    app.add_flag("--no-report", no_report, "Do not print the text report");
    app.add_flag("--pretty", pretty, "Indent the Chrome trace JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Verbose logging enabled");
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        // Configuration errors are fatal before any line is read
        auto config = logprof::core::ProfilerConfig::LoadFromFile(config_path);

        logprof::core::LogProfiler profiler(std::move(config));
        auto status = profiler.ProcessFile(log_path);

        if (status.has_error && !status.is_partial) {
            spdlog::error("[FAIL] {}", status.error_message);
            return 1;
        }
        if (status.is_partial) {
            spdlog::warn("[PARTIAL] {}", status.error_message);
        }

        profiler.Finalize();

        if (!no_report) {
            logprof::reporters::TextReporter text_reporter(profiler.Classifier());
            text_reporter.Render(profiler.Roots(), std::cout);
        }

        if (!no_trace) {
            logprof::reporters::ChromeTraceConfig trace_config;
            trace_config.pretty_print = pretty;

            logprof::reporters::ChromeTraceReporter trace_reporter(trace_config);
            auto written = trace_reporter.WriteFile(profiler.Roots(), output_path);
            if (written.empty()) {
                spdlog::error("[ERROR] Failed to write Chrome trace");
                return 1;
            }
            spdlog::info("Open 'chrome://tracing' or 'ui.perfetto.dev' and load {}", written.string());
        }

        PrintRunSummary(status, profiler);
        return 0;

    } catch (const logprof::core::ConfigError& e) {
        spdlog::error("[CONFIG] {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
