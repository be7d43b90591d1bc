// ============= main.cpp - kioskface CLI =============
#include "config.hpp"
#include "core/errors.hpp"
#include "pipeline/face_pipeline.hpp"
#include "recognition/opencv_face_extractor.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--config FILE] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  ingest <relative_path> [photographer]   Register a photo and index its faces\n";
    std::cout << "  identify <image_file> [threshold] [top_k]\n";
    std::cout << "                                          Print identify JSON for a probe image\n";
    std::cout << "  close <closing_user> [notes]            Record a closing and purge descriptors\n";
    std::cout << "  history                                 List closings, newest first\n";
    std::cout << "  stats                                   Photos, descriptors, last closing\n";
}

void setup_logging(const PipelineConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        std::filesystem::path p(config.log_file);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, 5 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>("kioskface", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

std::shared_ptr<EmbeddingExtractor> make_extractor(const PipelineConfig& config) {
    OpenCvFaceExtractor::Options options;
    options.detector_model = config.detector_model;
    options.recognizer_model = config.recognizer_model;
    options.score_threshold = config.score_threshold;
    options.nms_threshold = config.nms_threshold;
    options.instances = config.extractor_instances;
    options.shutdown_timeout = config.shutdown_timeout;
    return std::make_shared<OpenCvFaceExtractor>(options);
}

ImageBytes read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw UnreadableImage("Cannot open " + path);
    }
    return ImageBytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// ==================== COMMANDS ====================

int cmd_ingest(FacePipeline& pipeline, const std::vector<std::string>& args) {
    if (args.empty()) {
        spdlog::error("ingest: missing <relative_path>");
        return 2;
    }
    std::string photographer = args.size() > 1 ? args[1] : "";

    pipeline.start();

    int64_t photo_id = pipeline.photos().add(args[0], photographer);
    pipeline.on_photo_stored(photo_id, args[0]);
    pipeline.ingestion().wait_idle();

    auto stats = pipeline.ingestion().stats();
    size_t faces = pipeline.descriptors().by_photo(photo_id).size();

    std::cout << "photo_id=" << photo_id << " faces=" << faces << "\n";
    return stats.failed > 0 ? 1 : 0;
}

int cmd_identify(FacePipeline& pipeline, const std::vector<std::string>& args) {
    if (args.empty()) {
        spdlog::error("identify: missing <image_file>");
        return 2;
    }

    float threshold = pipeline.config().match_threshold;
    size_t top_k = static_cast<size_t>(pipeline.config().top_k);
    try {
        if (args.size() > 1) threshold = std::stof(args[1]);
        if (args.size() > 2) top_k = static_cast<size_t>(std::stoul(args[2]));
    } catch (const std::exception&) {
        spdlog::error("identify: invalid threshold/top_k");
        return 2;
    }

    pipeline.start();

    auto response = pipeline.identify_handler().handle(encode_base64(read_file(args[0])),
                                                       threshold, top_k);
    std::cout << response.body << "\n";
    return response.status == 200 ? 0 : 1;
}

int cmd_close(FacePipeline& pipeline, const std::vector<std::string>& args) {
    if (args.empty()) {
        spdlog::error("close: missing <closing_user>");
        return 2;
    }

    ClosingSummary summary;
    summary.closing_user = args[0];
    summary.notes = args.size() > 1 ? args[1] : "";

    auto writer = pipeline.closings().writer(summary);
    PurgeReport report = pipeline.on_closing(*writer);

    std::cout << "closing_id=" << report.closing_id
              << " descriptors_purged=" << report.descriptors_purged << "\n";
    return 0;
}

int cmd_history(FacePipeline& pipeline) {
    auto records = pipeline.closings().history();
    if (records.empty()) {
        std::cout << "No closings recorded\n";
        return 0;
    }

    for (const auto& r : records) {
        std::cout << "#" << r.id << "  " << to_minute_precision(r.closed_at)
                  << "  user=" << r.closing_user
                  << "  revenue=" << r.total_revenue
                  << "  digital=" << r.digital_count
                  << "  print=" << r.print_count;
        if (!r.notes.empty()) std::cout << "  notes=\"" << r.notes << "\"";
        std::cout << "\n";
    }
    return 0;
}

int cmd_stats(FacePipeline& pipeline) {
    std::cout << "photos:      " << pipeline.photos().count() << "\n";
    std::cout << "descriptors: " << pipeline.descriptors().count() << "\n";

    auto last = pipeline.closings().last_closing();
    if (last) {
        std::cout << "last close:  #" << last->id << " " << to_minute_precision(last->closed_at)
                  << " by " << last->closing_user << "\n";
    } else {
        std::cout << "last close:  never\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_file = "configs/kioskface.toml";
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() >= 2 && args[0] == "--config") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage(argv[0]);
        return args.empty() ? 2 : 0;
    }

    std::string command = args[0];
    args.erase(args.begin());

    try {
        PipelineConfig config = PipelineConfig::load(config_file);
        setup_logging(config);

        FacePipeline pipeline(config, make_extractor(config));

        int rc;
        if (command == "ingest") {
            rc = cmd_ingest(pipeline, args);
        } else if (command == "identify") {
            rc = cmd_identify(pipeline, args);
        } else if (command == "close") {
            rc = cmd_close(pipeline, args);
        } else if (command == "history") {
            rc = cmd_history(pipeline);
        } else if (command == "stats") {
            rc = cmd_stats(pipeline);
        } else {
            spdlog::error("Unknown command: {}", command);
            print_usage(argv[0]);
            rc = 2;
        }

        pipeline.shutdown();
        return rc;

    } catch (const PurgeFailure& e) {
        spdlog::critical("Closing failed: {}", e.what());
        return 3;
    } catch (const PipelineError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
