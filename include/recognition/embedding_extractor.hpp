/*
 * Embedding Extractor - capability boundary
 *
 * CONTRACT:
 * - extract(image) -> zero or more {embedding, box}
 * - No face is a success (empty vector), never an exception
 * - Throws UnreadableImage for empty/undecodable input
 * - Throws ExtractionUnavailable when the model is not loaded or the
 *   backend fails
 * - Degenerate boxes (w or h == 0) never leave extract()
 * - Every embedding has exactly dimension() components
 *
 * LIFECYCLE:
 *   construct -> load() -> extract()* -> shutdown()
 *
 * Implementations override detect_and_embed(); extract() enforces the
 * contract for all of them.
 */

#pragma once
#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    std::vector<FaceEmbedding> extract(const ImageBytes& image);

    virtual void load() = 0;
    virtual void shutdown() = 0;
    virtual bool is_loaded() const = 0;

    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;

    // extract_within() helper threads still running against this extractor.
    // A hung backend keeps them alive; once `limit` are outstanding, timed
    // calls fail fast instead of starting another thread.
    void set_helper_limit(size_t limit) { helper_limit = limit; }
    size_t helpers_in_flight() const { return helpers; }

    bool acquire_helper();
    void release_helper() { helpers--; }

    static constexpr size_t DEFAULT_HELPER_LIMIT = 4;

protected:
    virtual std::vector<FaceEmbedding> detect_and_embed(const ImageBytes& image) = 0;

private:
    std::atomic<size_t> helpers{0};
    std::atomic<size_t> helper_limit{DEFAULT_HELPER_LIMIT};
};

// Cosine similarity in [-1, 1]. Throws DimensionMismatch on length mismatch.
// A zero-norm operand scores 0.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// L2 normalize in place (no-op for the zero vector)
void l2_normalize(std::vector<float>& embedding);

// Runs extractor->extract() on a helper thread and throws ExtractionTimeout if
// it does not finish within `timeout`. A hung call keeps running detached and
// holds its own reference to the extractor. Throws ExtractionUnavailable when
// the extractor's helper limit is used up. timeout == 0 calls inline.
std::vector<FaceEmbedding> extract_within(const std::shared_ptr<EmbeddingExtractor>& extractor,
                                          const ImageBytes& image,
                                          std::chrono::milliseconds timeout);
