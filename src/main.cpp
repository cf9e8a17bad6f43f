#include "partfetch/config.hpp"
#include "partfetch/console_panel.hpp"
#include "partfetch/curl_http_client.hpp"
#include "partfetch/extraction.hpp"
#include "partfetch/logging.hpp"
#include "partfetch/scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) { g_interrupted.store(true); }

std::string describe(const partfetch::ExtractionOutcome& outcome) {
    switch (outcome.result) {
    case partfetch::ExtractionResult::Disabled:
        return "Extraction disabled";
    case partfetch::ExtractionResult::NotFound:
        return "No archive found";
    case partfetch::ExtractionResult::Extracted:
        return fmt::format("Extracted {} ({} part files removed)",
                           outcome.archive.filename().string(), outcome.removed);
    case partfetch::ExtractionResult::Failed:
        return fmt::format("Extraction failed: {}", outcome.message);
    }
    return outcome.message;
}

} // namespace

int main(int argc, char** argv) {
    try {
        partfetch::Config config;
        try {
            config = partfetch::parseCommandLine(argc, argv);
        } catch (const std::runtime_error& ex) {
            std::cerr << ex.what() << std::endl;
            partfetch::printUsage(argv[0]);
            return 1;
        }
        if (config.show_help) {
            partfetch::printUsage(argv[0]);
            return 0;
        }

        partfetch::initLogging(config);

        std::error_code ec;
        std::filesystem::create_directories(config.dest_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " +
                                     config.dest_dir.string() + " - " + ec.message());
        }

        partfetch::HttpOptions http_options;
        http_options.timeout_seconds = config.timeout_seconds;
        auto http = std::make_shared<partfetch::CurlHttpClient>(http_options);

        partfetch::SchedulerOptions options;
        options.max_concurrent = config.max_concurrent;
        options.dest_dir = config.dest_dir;
        partfetch::Scheduler scheduler(http, options);

        partfetch::CommandExtractor extractor(config.extractor);
        partfetch::ExtractionTrigger trigger(extractor, {config.extract, config.cleanup});
        std::optional<partfetch::ExtractionOutcome> outcome;
        bool batch_finished = false;
        scheduler.onBatchFinished([&](const std::vector<partfetch::TransferItem>&) {
            batch_finished = true;
            if (!g_interrupted.load()) {
                outcome = trigger.run(config.dest_dir);
            }
        });

        for (const auto& url : config.urls) {
            scheduler.addItem(url);
        }

        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        partfetch::ConsolePanel panel(std::cout);
        scheduler.start();
        while (!batch_finished && !g_interrupted.load()) {
            scheduler.waitAndProcess(std::chrono::milliseconds(200));
            panel.render(scheduler.snapshot(), scheduler.progress());
        }

        if (g_interrupted.load()) {
            spdlog::warn("Interrupted, stopping transfers");
            scheduler.cancelAll();
            while (scheduler.hasActiveTasks()) {
                scheduler.waitAndProcess(std::chrono::milliseconds(100));
            }
            scheduler.processEvents();
            panel.render(scheduler.snapshot(), scheduler.progress());
            panel.printLine("Interrupted; partial files are kept and resume on the next run.");
            return 130;
        }

        panel.render(scheduler.snapshot(), scheduler.progress());
        if (outcome) {
            panel.printLine(describe(*outcome));
        }

        const auto items = scheduler.snapshot();
        const bool all_done = std::all_of(items.begin(), items.end(), [](const auto& item) {
            return item.status == partfetch::TransferStatus::Done;
        });
        const bool extraction_failed =
            outcome && outcome->result == partfetch::ExtractionResult::Failed;
        return all_done && !extraction_failed ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
