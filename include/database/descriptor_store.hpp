/*
 * Descriptor Store - SQLite Backend
 *
 * TABLE: face_descriptors
 * ├── id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── photo_id (INTEGER, FK photos.id ON DELETE CASCADE)
 * ├── embedding (BLOB) - dim floats
 * ├── dim (INTEGER)
 * ├── box_x, box_y, box_w, box_h (INTEGER >= 0)
 * └── created_at (TEXT)
 *
 * OPERATIONS:
 * - add() / add_all(): insert (add_all = one transaction per photo)
 * - all(): snapshot of every live descriptor
 * - delete_by_photo(): remove one photo's faces
 * - purge_all(): unconditional bulk delete, standalone or inside the
 *   caller's Transaction (closing + purge commit together)
 *
 * Rows are never updated; readers see whole photos or nothing.
 */

#pragma once
#include "core/types.hpp"
#include "database/database.hpp"
#include <cstdint>
#include <vector>

class DescriptorStore {
public:
    DescriptorStore(Database& db, size_t dimension);

    size_t dimension() const { return embedding_size; }
    Database& database() { return db; }

    // Throws DimensionMismatch, StoreError (FK violation = unknown photo)
    int64_t add(const FaceDescriptor& descriptor);
    int64_t add(Transaction& tx, const FaceDescriptor& descriptor);

    // All faces of one photo commit together or not at all
    std::vector<int64_t> add_all(int64_t photo_id, const std::vector<FaceEmbedding>& faces);

    std::vector<FaceDescriptor> all() const;
    std::vector<FaceDescriptor> by_photo(int64_t photo_id) const;

    size_t delete_by_photo(int64_t photo_id);

    size_t purge_all();
    size_t purge_all(Transaction& tx);

    size_t count() const;
    size_t count(Transaction& tx) const;

    // Rows whose stored dimension differs from the current model
    size_t count_mismatched() const;

private:
    Database& db;
    size_t embedding_size;

    void create_tables();
    int64_t insert_row(const FaceDescriptor& descriptor);
    std::vector<FaceDescriptor> read_rows(Statement& stmt) const;
};
