#include "recognition/embedding_extractor.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

// ==================== CONTRACT ====================

std::vector<FaceEmbedding> EmbeddingExtractor::extract(const ImageBytes& image) {
    if (!is_loaded()) {
        throw ExtractionUnavailable(name() + " extractor is not loaded");
    }
    if (image.empty()) {
        throw UnreadableImage("Empty image buffer");
    }

    auto raw = detect_and_embed(image);

    std::vector<FaceEmbedding> faces;
    faces.reserve(raw.size());

    for (auto& face : raw) {
        // Clip to the image origin; the far edges are the adapter's job
        if (face.box.x < 0) {
            face.box.width += face.box.x;
            face.box.x = 0;
        }
        if (face.box.y < 0) {
            face.box.height += face.box.y;
            face.box.y = 0;
        }

        if (face.box.is_degenerate()) {
            spdlog::debug("Dropping degenerate face box {}x{}", face.box.width, face.box.height);
            continue;
        }

        if (face.embedding.size() != dimension()) {
            throw DimensionMismatch(dimension(), face.embedding.size());
        }

        faces.push_back(std::move(face));
    }

    return faces;
}

bool EmbeddingExtractor::acquire_helper() {
    size_t current = helpers.load();
    do {
        if (current >= helper_limit.load()) return false;
    } while (!helpers.compare_exchange_weak(current, current + 1));
    return true;
}

// ==================== COMPARISON ====================

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));

    // Clamp to [-1, 1] (numerical stability)
    return static_cast<float>(std::max(-1.0, std::min(1.0, sim)));
}

void l2_normalize(std::vector<float>& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

// ==================== TIMEOUT ====================

namespace {

// Returns the helper slot when the thread exits, however it exits
class HelperSlot {
public:
    explicit HelperSlot(std::shared_ptr<EmbeddingExtractor> extractor)
        : extractor(std::move(extractor)) {}
    ~HelperSlot() { extractor->release_helper(); }

    HelperSlot(const HelperSlot&) = delete;
    HelperSlot& operator=(const HelperSlot&) = delete;

private:
    std::shared_ptr<EmbeddingExtractor> extractor;
};

} // namespace

std::vector<FaceEmbedding> extract_within(const std::shared_ptr<EmbeddingExtractor>& extractor,
                                          const ImageBytes& image,
                                          std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return extractor->extract(image);
    }

    if (!extractor->acquire_helper()) {
        spdlog::warn("⚠️  {} has {} extraction(s) still hung, refusing new work",
                     extractor->name(), extractor->helpers_in_flight());
        throw ExtractionUnavailable(extractor->name() + " is saturated by hung extractions");
    }

    auto promise = std::make_shared<std::promise<std::vector<FaceEmbedding>>>();
    auto future = promise->get_future();

    std::thread worker;
    try {
        worker = std::thread([extractor, image, promise]() {
            HelperSlot slot(extractor);
            try {
                promise->set_value(extractor->extract(image));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    } catch (const std::exception& e) {
        extractor->release_helper();
        throw ExtractionUnavailable(std::string("Cannot start extraction thread: ") + e.what());
    }
    worker.detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        throw ExtractionTimeout(extractor->name() + " extraction exceeded " +
                                std::to_string(timeout.count()) + " ms");
    }

    return future.get();
}
