#pragma once
#include <chrono>
#include <map>
#include <string>

// ==================== SIMPLE TOML PARSER ====================
// Sections, key = value, quoted strings, # comments. Keys are "section.key".
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    void load_string(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;
};

// ==================== PIPELINE CONFIG ====================

enum class OverflowPolicy {
    Reject,   // submit() throws BackpressureError immediately
    Block     // submit() waits up to block_timeout, then throws
};

struct PipelineConfig {
    // [database]
    std::string db_path = "data/kioskface.db";

    // [storage]
    std::string upload_root = "uploads";

    // [extractor]
    std::string detector_model = "models/face_detection_yunet_2023mar.onnx";
    std::string recognizer_model = "models/face_recognition_sface_2021dec.onnx";
    float score_threshold = 0.9f;
    float nms_threshold = 0.3f;
    int extractor_instances = 2;
    std::chrono::milliseconds extract_timeout{30000};
    int max_hung_extractions = 4;                  // timed-out calls still running
    std::chrono::milliseconds shutdown_timeout{5000};

    // [ingestion]
    int workers = 4;
    int queue_capacity = 256;
    OverflowPolicy overflow_policy = OverflowPolicy::Reject;
    std::chrono::milliseconds block_timeout{250};

    // [search]
    float match_threshold = 0.65f;
    int top_k = 20;

    // [logging]
    std::string log_level = "info";
    std::string log_file;

    // Throws ConfigError on unreadable file or invalid values
    static PipelineConfig load(const std::string& path);
    static PipelineConfig from_toml(const SimpleToml& toml);

    void validate() const;
};

const char* to_string(OverflowPolicy policy);
