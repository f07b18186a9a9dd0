/**
 * Main entry point for the OHLCV ingestion pipeline
 */

#include <iostream>
#include <chrono>
#include <atomic>
#include <csignal>
#include <string>
#include <thread>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include "ohlcv_ingest/common/config.h"
#include "ohlcv_ingest/common/errors.h"
#include "ohlcv_ingest/common/logging.h"
#include "ohlcv_ingest/common/time_utils.h"
#include "ohlcv_ingest/data/exchange_client.h"
#include "ohlcv_ingest/pipeline/batch_runner.h"
#include "ohlcv_ingest/pipeline/symbol_universe.h"

namespace po = boost::program_options;
using namespace ohlcv_ingest;
using namespace std;

// Global signal handler
std::atomic<bool> running{true};

void signalHandler(int signal) {
    (void)signal;
    running = false;
}

int main(int argc, char** argv) {
    try {
        // Parse command line options
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "produce help message")
            ("config", po::value<std::string>()->default_value("config/pipeline.yaml"), "pipeline configuration file")
            ("symbols", po::value<std::string>(), "comma-separated symbols, replaces the configured list")
            ("start", po::value<std::string>(), "window start, ISO-8601 UTC")
            ("end", po::value<std::string>(), "window end, ISO-8601 UTC")
            ("log-level", po::value<std::string>(), "log level (debug, info, warning, error)")
        ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            cout << desc << "\n";
            return 0;
        }

        // Load configuration
        common::Config config(vm["config"].as<std::string>());

        if (vm.count("log-level")) {
            config.setLogLevel(vm["log-level"].as<std::string>());
        }
        config.applyLogging();

        if (vm.count("symbols")) {
            std::vector<std::string> symbols;
            std::string list = vm["symbols"].as<std::string>();
            boost::algorithm::split(symbols, list, boost::algorithm::is_any_of(","));
            for (auto& symbol : symbols) {
                boost::algorithm::trim(symbol);
            }
            config.setSymbols(symbols);
        }

        config.setWindow(vm.count("start") ? vm["start"].as<std::string>() : "",
                         vm.count("end") ? vm["end"].as<std::string>() : "");

        // Register signal handler
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        auto symbols = pipeline::resolveSymbols(config.getCollectionConfig());
        auto window = pipeline::resolveWindow(config.getCollectionConfig());

        LOG_INFO("Collecting " + std::to_string(symbols.size()) + " symbols " +
                 config.getCollectionConfig().interval + " from " + common::formatIsoTimestamp(window.first) +
                 " to " + common::formatIsoTimestamp(window.second));

        // Initialize components
        auto client = data::createExchangeClient(config);
        pipeline::BatchRunner runner(config, *client);

        // Forward SIGINT/SIGTERM to the runner
        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            while (!finished.load()) {
                if (!running.load()) {
                    LOG_WARNING("Shutdown requested, cancelling batch");
                    runner.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto summary = runner.run(symbols, window.first, window.second);
        finished = true;
        watcher.join();

        for (const auto& outcome : summary.outcomes) {
            if (outcome.success) {
                cout << outcome.symbol << ": OK " << outcome.result->manifest.row_count << " rows, "
                     << outcome.result->report.gaps_detected << " gaps, "
                     << outcome.result->report.outliers_detected << " outliers" << endl;
            } else {
                cout << outcome.symbol << ": FAILED " << outcome.error << endl;
            }
        }

        common::g_logger.flush();
        return summary.failed() == 0 ? 0 : 1;
    } catch (const ConfigError& e) {
        cerr << "Configuration error: " << e.what() << endl;
        return 2;
    } catch (const std::exception& e) {
        cerr << "Fatal error: " << e.what() << endl;
        return 1;
    }
}
