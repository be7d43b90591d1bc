#include "config.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <sstream>

// ==================== SIMPLE TOML ====================

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    load_string(buffer.str());
    return true;
}

void SimpleToml::load_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line, section;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // trailing comment on unquoted values
            auto hash = val.find('#');
            if (hash != std::string::npos) {
                val = trim(val.substr(0, hash));
            }
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + get(key) + "'");
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": '" + get(key) + "'");
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + v + "'");
}

// ==================== PIPELINE CONFIG ====================

PipelineConfig PipelineConfig::load(const std::string& path) {
    SimpleToml toml;
    if (!toml.load(path)) {
        throw ConfigError("Cannot read config file: " + path);
    }
    return from_toml(toml);
}

PipelineConfig PipelineConfig::from_toml(const SimpleToml& toml) {
    PipelineConfig c;

    c.db_path = toml.get("database.path", c.db_path);
    c.upload_root = toml.get("storage.upload_root", c.upload_root);

    c.detector_model = toml.get("extractor.detector_model", c.detector_model);
    c.recognizer_model = toml.get("extractor.recognizer_model", c.recognizer_model);
    c.score_threshold = toml.get_float("extractor.score_threshold", c.score_threshold);
    c.nms_threshold = toml.get_float("extractor.nms_threshold", c.nms_threshold);
    c.extractor_instances = toml.get_int("extractor.instances", c.extractor_instances);
    c.extract_timeout = std::chrono::milliseconds(
        toml.get_int("extractor.timeout_ms", static_cast<int>(c.extract_timeout.count())));
    c.max_hung_extractions = toml.get_int("extractor.max_hung", c.max_hung_extractions);
    c.shutdown_timeout = std::chrono::milliseconds(
        toml.get_int("extractor.shutdown_timeout_ms", static_cast<int>(c.shutdown_timeout.count())));

    c.workers = toml.get_int("ingestion.workers", c.workers);
    c.queue_capacity = toml.get_int("ingestion.queue_capacity", c.queue_capacity);

    std::string policy = toml.get("ingestion.overflow_policy", "reject");
    if (policy == "reject") {
        c.overflow_policy = OverflowPolicy::Reject;
    } else if (policy == "block") {
        c.overflow_policy = OverflowPolicy::Block;
    } else {
        throw ConfigError("Unknown ingestion.overflow_policy: '" + policy + "' (reject|block)");
    }
    c.block_timeout = std::chrono::milliseconds(
        toml.get_int("ingestion.block_timeout_ms", static_cast<int>(c.block_timeout.count())));

    c.match_threshold = toml.get_float("search.threshold", c.match_threshold);
    c.top_k = toml.get_int("search.top_k", c.top_k);

    c.log_level = toml.get("logging.level", c.log_level);
    c.log_file = toml.get("logging.file", c.log_file);

    c.validate();
    return c;
}

void PipelineConfig::validate() const {
    if (db_path.empty()) throw ConfigError("database.path must not be empty");
    if (workers <= 0) throw ConfigError("ingestion.workers must be > 0");
    if (queue_capacity <= 0) throw ConfigError("ingestion.queue_capacity must be > 0");
    if (block_timeout.count() < 0) throw ConfigError("ingestion.block_timeout_ms must be >= 0");
    if (extractor_instances <= 0) throw ConfigError("extractor.instances must be > 0");
    if (extract_timeout.count() < 0) throw ConfigError("extractor.timeout_ms must be >= 0");
    if (max_hung_extractions <= 0) throw ConfigError("extractor.max_hung must be > 0");
    if (shutdown_timeout.count() < 0) throw ConfigError("extractor.shutdown_timeout_ms must be >= 0");
    if (match_threshold < -1.0f || match_threshold > 1.0f) {
        throw ConfigError("search.threshold must be within [-1, 1]");
    }
    if (top_k <= 0) throw ConfigError("search.top_k must be > 0");

    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char* l : levels) {
        if (log_level == l) known = true;
    }
    if (!known) throw ConfigError("Unknown logging.level: '" + log_level + "'");
}

const char* to_string(OverflowPolicy policy) {
    return policy == OverflowPolicy::Block ? "block" : "reject";
}
