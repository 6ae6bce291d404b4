// main.cc - photo timestamp planner and stamper
#include "day_sampler.hh"
#include "error_handler.hh"
#include "incident_batch.hh"
#include "run_config.hh"
#include "run_report.hh"
#include "stamp_pipeline.hh"
#include "stamp_renderer.hh"
#include <iomanip>
#include <iostream>
#include <string>

namespace {

const char* DEFAULT_CONFIG = "config.json";

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <mode> [config]" << std::endl;
    std::cout << std::endl;
    std::cout << "Modes:" << std::endl;
    std::cout << "  run [config]" << std::endl;
    std::cout << "    - Assign timestamps and locations, write *_stamped.png next to every photo" << std::endl;
    std::cout << "  plan [config]" << std::endl;
    std::cout << "    - Print the schedule only, nothing is rendered" << std::endl;
    std::cout << "  clean [config]" << std::endl;
    std::cout << "    - Remove stamped outputs of a previous run" << std::endl;
    std::cout << std::endl;
    std::cout << "The config key \"mode\" selects what folder_path holds:" << std::endl;
    std::cout << "  single - one incident with phase subfolders (default)" << std::endl;
    std::cout << "  batch  - one incident per subfolder, each dated by its name" << std::endl;
    std::cout << "  days   - dated day folders, one photo stamped per day" << std::endl;
    std::cout << std::endl;
    std::cout << "Default config: " << DEFAULT_CONFIG << std::endl;
}

RunConfig load_config(int argc, char** argv) {
    std::string config_path = (argc > 2) ? argv[2] : DEFAULT_CONFIG;
    RunConfig config = RunConfig::LoadFromFile(config_path);

    ErrorHandler::SetLogFile(config.log_file);
    if (config.verbose) {
        ErrorHandler::SetMinLevel(ErrorHandler::ErrorLevel::DEBUG);
    }
    return config;
}

std::vector<TimedPhoto> plan_for(const RunConfig& config, const ImageDecoder& decoder,
                                 RunReport& report) {
    switch (config.mode) {
        case RunMode::BATCH:
            return IncidentBatch(config, decoder).Plan(report);
        case RunMode::DAYS:
            return DaySampler(config).Plan(report);
        case RunMode::SINGLE:
        default:
            return StampPipeline(config, decoder).Plan(report);
    }
}

std::vector<StampRecord> run_for(const RunConfig& config, const ImageDecoder& decoder,
                                 StampRenderer& renderer, RunReport& report) {
    switch (config.mode) {
        case RunMode::BATCH:
            return IncidentBatch(config, decoder).Run(renderer, report);
        case RunMode::DAYS:
            return DaySampler(config).Run(renderer, report);
        case RunMode::SINGLE:
        default:
            return StampPipeline(config, decoder).Run(renderer, report);
    }
}

void finish_report(const RunConfig& config, const RunReport& report) {
    report.LogSummary();
    if (!config.report_path.empty() && !report.Save(config.report_path)) {
        LOG_WARNING("Main", "Run report could not be saved");
    }
}

int mode_run(int argc, char** argv) {
    RunConfig config = load_config(argc, argv);

    size_t removed = OpenCvStampRenderer::CleanStampedOutputs(config.folder_path);
    if (removed > 0) {
        LOG_INFO("Main", "Removed " + std::to_string(removed) + " stamped images from a previous run");
    }

    OpenCvImageDecoder decoder;
    OpenCvStampRenderer renderer;
    renderer.SetRotateLandscape(config.rotate_landscape);
    renderer.SetMaxDimension(config.max_dimension);

    RunReport report;
    std::vector<StampRecord> records = run_for(config, decoder, renderer, report);

    finish_report(config, report);
    return records.empty() ? -1 : 0;
}

int mode_plan(int argc, char** argv) {
    RunConfig config = load_config(argc, argv);

    OpenCvImageDecoder decoder;
    RunReport report;
    std::vector<TimedPhoto> timeline = plan_for(config, decoder, report);
    StampFormatter formatter = FormatterFor(config);

    std::string current_phase;
    for (const auto& timed : timeline) {
        if (timed.phase != current_phase) {
            current_phase = timed.phase;
            std::cout << std::endl << "== " << current_phase << " ==" << std::endl;
        }
        std::cout << "  " << std::left << std::setw(28) << formatter.Format(timed.at)
                  << " [" << (timed.group_key.empty() ? "-" : timed.group_key) << "] "
                  << timed.photo.sort_key << std::endl;
    }
    std::cout << std::endl;

    if (!config.schedule_path.empty() && !SaveTimeline(timeline, formatter, config.schedule_path)) {
        LOG_WARNING("Main", "Schedule could not be saved");
    }
    report.RecordStamped(timeline.size(), 0);
    finish_report(config, report);
    return 0;
}

int mode_clean(int argc, char** argv) {
    RunConfig config = load_config(argc, argv);
    size_t removed = OpenCvStampRenderer::CleanStampedOutputs(config.folder_path);
    LOG_INFO("Main", "Removed " + std::to_string(removed) + " stamped images");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return -1;
    }

    std::string mode = argv[1];

    try {
        if (mode == "run") {
            return mode_run(argc, argv);
        } else if (mode == "plan") {
            return mode_plan(argc, argv);
        } else if (mode == "clean") {
            return mode_clean(argc, argv);
        }
    } catch (const ConfigError& e) {
        LOG_CRITICAL("Main", std::string("Configuration error, nothing was stamped: ") + e.what());
        return -1;
    } catch (const std::exception& e) {
        LOG_EXCEPTION(e, "Main", "mode " + mode);
        return -1;
    }

    LOG_ERROR("Main", "Unknown mode: " + mode);
    print_usage(argv[0]);
    return -1;
}
