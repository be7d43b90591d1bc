#include "api/identify_handler.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

IdentifyHandler::IdentifyHandler(const SimilaritySearch& search, const PhotoCatalog& catalog,
                                 float threshold, size_t top_k)
    : search(search), catalog(catalog), threshold(threshold), top_k(top_k)
{
}

ApiResponse IdentifyHandler::handle(const std::string& image_b64) const {
    return handle(image_b64, threshold, top_k);
}

ApiResponse IdentifyHandler::handle(const std::string& image_b64, float threshold, size_t top_k) const {
    std::string payload = strip_data_url(image_b64);
    if (payload.empty()) {
        return error_response(400, "No image provided");
    }

    ImageBytes image;
    if (!decode_base64(payload, image) || image.empty()) {
        return error_response(400, "Invalid base64 image");
    }

    try {
        IdentifyResult result = search.identify(image, threshold, top_k);
        return {200, render(result)};

    } catch (const UnreadableImage& e) {
        spdlog::warn("Identify: {}", e.what());
        return error_response(400, e.what());
    } catch (const ExtractionUnavailable& e) {
        spdlog::error("Identify: {}", e.what());
        return error_response(503, "face identification temporarily unavailable");
    } catch (const PipelineError& e) {
        spdlog::error("Identify: {}", e.what());
        return error_response(500, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Identify (unexpected): {}", e.what());
        return error_response(500, e.what());
    }
}

std::string IdentifyHandler::render(const IdentifyResult& result) const {
    std::ostringstream out;

    if (result.status == IdentifyStatus::NoFaceDetected) {
        out << R"({"results":[],"message":"no face detected"})";
        return out.str();
    }

    std::vector<int64_t> photo_ids;
    photo_ids.reserve(result.matches.size());
    for (const auto& m : result.matches) {
        photo_ids.push_back(m.photo_id);
    }
    auto photos = catalog.find_many(photo_ids);

    out << R"({"results":[)";
    bool first = true;
    for (const auto& m : result.matches) {
        auto it = photos.find(m.photo_id);
        if (it == photos.end()) continue;   // photo deleted after the snapshot

        if (!first) out << ",";
        out << "{\"photo_id\":" << m.photo_id
            << ",\"similarity\":" << std::fixed << std::setprecision(4) << m.similarity
            << ",\"path\":\"" << json_escape(it->second.relative_path) << "\""
            << ",\"date\":\"" << json_escape(to_minute_precision(it->second.created_at)) << "\"}";
        first = false;
    }
    out << "]}";

    return out.str();
}

ApiResponse error_response(int status, const std::string& message) {
    return {status, "{\"error\":\"" + json_escape(message) + "\"}"};
}
