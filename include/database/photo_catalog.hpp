/*
 * Photo Catalog - read side of the upload subsystem's table
 *
 * TABLE: photos
 * ├── id (INTEGER PRIMARY KEY)
 * ├── filename (TEXT)
 * ├── relative_path (TEXT)  - e.g. 2025-11-24/juan/img_001.jpg
 * ├── photographer (TEXT)
 * └── created_at (TEXT)     - capture/upload time, UTC
 *
 * The upload subsystem owns the files; this core only needs the row to
 * exist (descriptor FK) and the path/date for identify results.
 * remove() cascades to face_descriptors.
 */

#pragma once
#include "database/database.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct Photo {
    int64_t id = 0;
    std::string filename;
    std::string relative_path;
    std::string photographer;
    std::string created_at;
};

class PhotoCatalog {
public:
    explicit PhotoCatalog(Database& db);

    int64_t add(const std::string& relative_path, const std::string& photographer);

    std::optional<Photo> find(int64_t photo_id) const;
    std::map<int64_t, Photo> find_many(const std::vector<int64_t>& photo_ids) const;

    // Deletes the photo row and, by cascade, its descriptors
    bool remove(int64_t photo_id);

    size_t count() const;

private:
    Database& db;

    void create_tables();
};
