#include "search/similarity_search.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

SimilaritySearch::SimilaritySearch(std::shared_ptr<EmbeddingExtractor> extractor,
                                   const DescriptorIndex& index,
                                   std::chrono::milliseconds extract_timeout)
    : extractor(std::move(extractor)), index(index), extract_timeout(extract_timeout)
{
    if (!this->extractor) {
        throw ExtractionUnavailable("Search requires an extractor");
    }
}

IdentifyResult SimilaritySearch::identify(const ImageBytes& probe_image,
                                          float threshold, size_t top_k) const {
    auto start = std::chrono::steady_clock::now();

    IdentifyResult result;
    auto faces = extract_within(extractor, probe_image, extract_timeout);

    if (faces.empty()) {
        result.status = IdentifyStatus::NoFaceDetected;
        spdlog::info("🔍 Identify: no face detected in probe");
        return result;
    }

    if (faces.size() > 1) {
        spdlog::debug("Probe has {} faces, using the first", faces.size());
    }

    result.matches = rank(faces.front().embedding, threshold, top_k);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("🔍 Identify: {} match(es) > {:.2f} ({} ms)", result.matches.size(), threshold, ms);

    return result;
}

std::vector<MatchResult> SimilaritySearch::rank(const std::vector<float>& probe_embedding,
                                                float threshold, size_t top_k) const {
    return index.search(probe_embedding, threshold, top_k);
}
