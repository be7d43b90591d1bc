#pragma once
#include <cstdint>
#include <string>
#include <vector>

using ImageBytes = std::vector<unsigned char>;

// Pixel rectangle inside the source photo (x, y, width, height >= 0)
struct BoundingBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool is_degenerate() const { return width <= 0 || height <= 0; }
    bool is_valid() const { return x >= 0 && y >= 0 && width >= 0 && height >= 0; }
};

// One detected face as returned by the extractor
struct FaceEmbedding {
    std::vector<float> embedding;
    BoundingBox box;
};

// One persisted face row
struct FaceDescriptor {
    int64_t id = 0;
    int64_t photo_id = 0;
    std::vector<float> embedding;
    BoundingBox box;
    std::string created_at;
};

struct MatchResult {
    int64_t descriptor_id = 0;
    int64_t photo_id = 0;
    float similarity = 0.0f;
    BoundingBox box;
};
