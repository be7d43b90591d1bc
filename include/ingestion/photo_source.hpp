#pragma once
#include "core/types.hpp"
#include <string>

// Resolves an upload's file reference to image bytes
class PhotoSource {
public:
    virtual ~PhotoSource() = default;

    // Throws UnreadableImage if the reference cannot be read
    virtual ImageBytes read(const std::string& file_reference) = 0;
};

// Files under the kiosk upload folder, e.g. uploads/2025-11-24/juan/img_001.jpg
class FileSystemPhotoSource : public PhotoSource {
public:
    explicit FileSystemPhotoSource(std::string upload_root);

    ImageBytes read(const std::string& file_reference) override;

    const std::string& root() const { return upload_root; }

private:
    std::string upload_root;
};
