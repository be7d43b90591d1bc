/*
 * Descriptor Index - scoring backend for identify()
 *
 * search(probe, threshold, top_k):
 * - score = cosine_similarity(probe, descriptor)
 * - keep score > threshold (strict)
 * - order: score desc, descriptor id asc
 * - truncate to top_k
 *
 * LinearScanIndex is O(N*D) per query over a snapshot of the store. Fine for
 * one event day of photos; an ANN index would slot in behind this interface.
 */

#pragma once
#include "core/types.hpp"
#include "database/descriptor_store.hpp"
#include <vector>

class DescriptorIndex {
public:
    virtual ~DescriptorIndex() = default;

    // Throws DimensionMismatch if the probe does not match stored descriptors
    virtual std::vector<MatchResult> search(const std::vector<float>& probe,
                                            float threshold, size_t top_k) const = 0;
};

class LinearScanIndex : public DescriptorIndex {
public:
    explicit LinearScanIndex(const DescriptorStore& store);

    std::vector<MatchResult> search(const std::vector<float>& probe,
                                    float threshold, size_t top_k) const override;

private:
    const DescriptorStore& store;
};

// Orders by similarity desc then descriptor id asc, keeps the first top_k
void rank_matches(std::vector<MatchResult>& matches, size_t top_k);
