#include "utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
const std::string BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

// ==================== BASE64 ====================

bool decode_base64(const std::string& encoded, ImageBytes& output) {
    output.clear();
    output.reserve(encoded.size() * 3 / 4);

    unsigned int val = 0;
    int valb = -8;
    for (unsigned char c : encoded) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') break;

        size_t pos = BASE64_CHARS.find(static_cast<char>(c));
        if (pos == std::string::npos) {
            output.clear();
            return false;
        }

        val = ((val << 6) + static_cast<unsigned int>(pos)) & 0xFFFFFF;
        valb += 6;

        if (valb >= 0) {
            output.push_back(static_cast<unsigned char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return true;
}

std::string encode_base64(const ImageBytes& data) {
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    unsigned int val = 0;
    int valb = -6;
    for (unsigned char c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(BASE64_CHARS[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        encoded.push_back(BASE64_CHARS[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    while (encoded.size() % 4) {
        encoded.push_back('=');
    }

    return encoded;
}

std::string strip_data_url(const std::string& payload) {
    if (payload.compare(0, 5, "data:") != 0) {
        return payload;
    }
    auto comma = payload.find(',');
    return comma == std::string::npos ? std::string() : payload.substr(comma + 1);
}

// ==================== JSON ====================

std::string json_escape(const std::string& s) {
    std::ostringstream ss;
    for (unsigned char c : s) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
    return ss.str();
}

// ==================== TIMESTAMPS ====================

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_utc{};
    gmtime_r(&time_t_now, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string to_minute_precision(const std::string& timestamp) {
    // YYYY-MM-DD HH:MM is the first 16 chars
    return timestamp.size() > 16 ? timestamp.substr(0, 16) : timestamp;
}
