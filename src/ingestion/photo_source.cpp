#include "ingestion/photo_source.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

FileSystemPhotoSource::FileSystemPhotoSource(std::string upload_root)
    : upload_root(std::move(upload_root))
{
}

ImageBytes FileSystemPhotoSource::read(const std::string& file_reference) {
    std::filesystem::path ref(file_reference);
    if (file_reference.empty() || ref.is_absolute()) {
        throw UnreadableImage("Invalid file reference: '" + file_reference + "'");
    }
    for (const auto& part : ref) {
        if (part == "..") {
            throw UnreadableImage("File reference escapes upload root: " + file_reference);
        }
    }

    std::filesystem::path full = std::filesystem::path(upload_root) / ref;

    std::ifstream file(full, std::ios::binary);
    if (!file.is_open()) {
        throw UnreadableImage("Cannot open " + full.string());
    }

    ImageBytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw UnreadableImage("Read error on " + full.string());
    }
    if (bytes.empty()) {
        throw UnreadableImage("Empty file " + full.string());
    }
    return bytes;
}
