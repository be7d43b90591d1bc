#include "recognition/opencv_face_extractor.hpp"
#include "core/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

OpenCvFaceExtractor::OpenCvFaceExtractor(Options options)
    : options(std::move(options))
{
    spdlog::info("🎭 Initializing OpenCV face extractor");
    spdlog::info("   Detector: {}", this->options.detector_model);
    spdlog::info("   Recognizer: {}", this->options.recognizer_model);
    spdlog::info("   Instances: {}", this->options.instances);
}

OpenCvFaceExtractor::~OpenCvFaceExtractor() {
    // Last reference: no extraction can still be running
    ready = false;
    std::unique_lock<std::shared_timed_mutex> lock(lifecycle_mutex);
    slots.clear();
}

// ==================== LIFECYCLE ====================

void OpenCvFaceExtractor::load() {
    std::unique_lock<std::shared_timed_mutex> lock(lifecycle_mutex);
    if (!slots.empty()) {
        ready = true;
        return;
    }

    for (const auto& path : {options.detector_model, options.recognizer_model}) {
        if (!std::filesystem::exists(path)) {
            throw ExtractionUnavailable("Model file not found: " + path);
        }
    }

    std::vector<std::unique_ptr<ModelSlot>> loaded;
    try {
        for (int i = 0; i < options.instances; ++i) {
            auto slot = std::make_unique<ModelSlot>();
            slot->detector = cv::FaceDetectorYN::create(
                options.detector_model, "", cv::Size(320, 320),
                options.score_threshold, options.nms_threshold, options.top_k);
            slot->recognizer = cv::FaceRecognizerSF::create(options.recognizer_model, "");
            loaded.push_back(std::move(slot));
        }
    } catch (const cv::Exception& e) {
        throw ExtractionUnavailable(std::string("Cannot load face models: ") + e.what());
    }

    slots = std::move(loaded);
    ready = true;
    spdlog::info("✓ Face extractor ready ({} instances, embedding size: {})",
                 slots.size(), SFACE_DIMENSION);
}

void OpenCvFaceExtractor::shutdown() {
    ready = false;

    std::unique_lock<std::shared_timed_mutex> lock(lifecycle_mutex, std::defer_lock);
    if (!lock.try_lock_for(options.shutdown_timeout)) {
        spdlog::error("❌ Face extractor still busy after {} ms, leaving models to the destructor",
                      options.shutdown_timeout.count());
        return;
    }
    if (slots.empty()) return;

    slots.clear();
    spdlog::info("Face extractor models released");
}

bool OpenCvFaceExtractor::is_loaded() const {
    return ready;
}

// ==================== DECODE ====================

cv::Mat OpenCvFaceExtractor::decode(const ImageBytes& image) const {
    cv::Mat buffer(1, static_cast<int>(image.size()), CV_8UC1,
                   const_cast<unsigned char*>(image.data()));

    cv::Mat img;
    try {
        img = cv::imdecode(buffer, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw UnreadableImage(std::string("Image decode failed: ") + e.what());
    }

    if (img.empty()) {
        throw UnreadableImage("Image bytes are not a supported image format");
    }
    return img;
}

// ==================== DETECT + EMBED ====================

std::vector<FaceEmbedding> OpenCvFaceExtractor::detect_and_embed(const ImageBytes& image) {
    cv::Mat img = decode(image);

    std::shared_lock<std::shared_timed_mutex> lifecycle(lifecycle_mutex);
    if (!ready || slots.empty()) {
        throw ExtractionUnavailable(name() + " extractor was shut down");
    }

    ModelSlot& slot = *slots[next_slot.fetch_add(1) % slots.size()];
    std::lock_guard<std::mutex> lock(slot.mutex);

    std::vector<FaceEmbedding> results;
    const cv::Rect frame(0, 0, img.cols, img.rows);

    try {
        cv::Mat faces;
        slot.detector->setInputSize(img.size());
        slot.detector->detect(img, faces);

        for (int i = 0; i < faces.rows; ++i) {
            cv::Rect raw(static_cast<int>(faces.at<float>(i, 0)),
                         static_cast<int>(faces.at<float>(i, 1)),
                         static_cast<int>(faces.at<float>(i, 2)),
                         static_cast<int>(faces.at<float>(i, 3)));
            cv::Rect safe = raw & frame;
            if (safe.area() <= 0) continue;

            cv::Mat aligned, feature;
            slot.recognizer->alignCrop(img, faces.row(i), aligned);
            slot.recognizer->feature(aligned, feature);

            FaceEmbedding face;
            face.embedding.assign(feature.ptr<float>(0), feature.ptr<float>(0) + feature.total());
            l2_normalize(face.embedding);
            face.box = {safe.x, safe.y, safe.width, safe.height};
            results.push_back(std::move(face));
        }
    } catch (const cv::Exception& e) {
        throw ExtractionUnavailable(std::string("Face model inference failed: ") + e.what());
    }

    spdlog::debug("{} face(s) in {}x{} image", results.size(), img.cols, img.rows);
    return results;
}
