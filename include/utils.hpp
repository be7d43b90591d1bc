#pragma once
#include "core/types.hpp"
#include <string>

// Decode standard base64 (whitespace ignored, '=' padding optional).
// Returns false on any character outside the alphabet.
bool decode_base64(const std::string& encoded, ImageBytes& output);

std::string encode_base64(const ImageBytes& data);

// "data:image/jpeg;base64,AAAA" -> "AAAA"; plain payloads returned unchanged
std::string strip_data_url(const std::string& payload);

// Escape a string for embedding inside a JSON string literal
std::string json_escape(const std::string& s);

// "2025-11-24 14:30:52" (UTC, what SQLite CURRENT_TIMESTAMP stores)
std::string current_timestamp();

// "2025-11-24 14:30:52" -> "2025-11-24 14:30"
std::string to_minute_precision(const std::string& timestamp);
