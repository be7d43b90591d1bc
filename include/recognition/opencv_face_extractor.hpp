/*
 * OpenCV Face Extractor - YuNet + SFace
 *
 * FEATURES:
 * - Detection: cv::FaceDetectorYN (YuNet ONNX)
 * - Embedding: cv::FaceRecognizerSF (SFace ONNX), 128 floats
 * - Alignment with the 5 YuNet landmarks before embedding
 * - Embeddings L2-normalized
 *
 * INPUT:
 * - Encoded image bytes (JPEG/PNG/...), decoded with cv::imdecode
 *
 * THREADING:
 * - `instances` independent model copies; each call locks one slot,
 *   so up to `instances` extractions run in parallel
 * - load()/shutdown() are exclusive against in-flight extractions
 * - shutdown() refuses new calls at once and waits at most
 *   `shutdown_timeout` for running ones; if a call is hung the models are
 *   released by the destructor once the last reference goes away
 */

#pragma once
#include "recognition/embedding_extractor.hpp"
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

class OpenCvFaceExtractor : public EmbeddingExtractor {
public:
    struct Options {
        std::string detector_model;
        std::string recognizer_model;
        float score_threshold = 0.9f;
        float nms_threshold = 0.3f;
        int top_k = 5000;
        int instances = 2;
        std::chrono::milliseconds shutdown_timeout{5000};
    };

    static constexpr size_t SFACE_DIMENSION = 128;

    explicit OpenCvFaceExtractor(Options options);
    ~OpenCvFaceExtractor() override;

    void load() override;
    void shutdown() override;
    bool is_loaded() const override;

    size_t dimension() const override { return SFACE_DIMENSION; }
    std::string name() const override { return "opencv-sface"; }

protected:
    std::vector<FaceEmbedding> detect_and_embed(const ImageBytes& image) override;

private:
    struct ModelSlot {
        std::mutex mutex;
        cv::Ptr<cv::FaceDetectorYN> detector;
        cv::Ptr<cv::FaceRecognizerSF> recognizer;
    };

    Options options;
    std::vector<std::unique_ptr<ModelSlot>> slots;
    std::atomic<size_t> next_slot{0};
    std::atomic<bool> ready{false};
    mutable std::shared_timed_mutex lifecycle_mutex;

    cv::Mat decode(const ImageBytes& image) const;
};
