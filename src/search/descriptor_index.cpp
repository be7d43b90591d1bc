#include "search/descriptor_index.hpp"
#include "recognition/embedding_extractor.hpp"
#include <algorithm>

LinearScanIndex::LinearScanIndex(const DescriptorStore& store)
    : store(store)
{
}

std::vector<MatchResult> LinearScanIndex::search(const std::vector<float>& probe,
                                                 float threshold, size_t top_k) const {
    std::vector<MatchResult> matches;
    if (top_k == 0) return matches;

    // Snapshot under the db lock, score without it
    auto descriptors = store.all();

    for (const auto& d : descriptors) {
        float score = cosine_similarity(probe, d.embedding);
        if (score > threshold) {
            MatchResult m;
            m.descriptor_id = d.id;
            m.photo_id = d.photo_id;
            m.similarity = score;
            m.box = d.box;
            matches.push_back(m);
        }
    }

    rank_matches(matches, top_k);
    return matches;
}

void rank_matches(std::vector<MatchResult>& matches, size_t top_k) {
    std::sort(matches.begin(), matches.end(), [](const MatchResult& a, const MatchResult& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.descriptor_id < b.descriptor_id;
    });

    if (matches.size() > top_k) {
        matches.resize(top_k);
    }
}
