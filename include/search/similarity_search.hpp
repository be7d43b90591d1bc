/*
 * Similarity Search - probe image -> ranked photo matches
 *
 * identify(image, threshold, top_k):
 *   1. extract probe faces (timeout-bounded)
 *   2. no face      -> status NoFaceDetected, empty matches
 *   3. first face   -> DescriptorIndex::search
 *
 * Several faces in the probe: only the first detection is used.
 * ExtractionUnavailable / UnreadableImage / DimensionMismatch propagate.
 */

#pragma once
#include "recognition/embedding_extractor.hpp"
#include "search/descriptor_index.hpp"
#include <chrono>
#include <memory>
#include <vector>

constexpr float DEFAULT_MATCH_THRESHOLD = 0.65f;
constexpr size_t DEFAULT_TOP_K = 20;

enum class IdentifyStatus {
    Found,          // probe had a face (matches may still be empty)
    NoFaceDetected
};

struct IdentifyResult {
    IdentifyStatus status = IdentifyStatus::Found;
    std::vector<MatchResult> matches;
};

class SimilaritySearch {
public:
    SimilaritySearch(std::shared_ptr<EmbeddingExtractor> extractor,
                     const DescriptorIndex& index,
                     std::chrono::milliseconds extract_timeout = std::chrono::milliseconds(0));

    IdentifyResult identify(const ImageBytes& probe_image,
                            float threshold = DEFAULT_MATCH_THRESHOLD,
                            size_t top_k = DEFAULT_TOP_K) const;

    std::vector<MatchResult> rank(const std::vector<float>& probe_embedding,
                                  float threshold = DEFAULT_MATCH_THRESHOLD,
                                  size_t top_k = DEFAULT_TOP_K) const;

private:
    std::shared_ptr<EmbeddingExtractor> extractor;
    const DescriptorIndex& index;
    std::chrono::milliseconds extract_timeout;
};
