#include "database/descriptor_store.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

// ==================== CONSTRUCTOR ====================

DescriptorStore::DescriptorStore(Database& db, size_t dimension)
    : db(db), embedding_size(dimension)
{
    if (dimension == 0) {
        throw StoreError("Descriptor dimension must be > 0");
    }

    create_tables();

    spdlog::info("🧬 Descriptor store ready");
    spdlog::info("   Embedding size: {}", embedding_size);
    spdlog::info("   Live descriptors: {}", count());
}

void DescriptorStore::create_tables() {
    auto lock = db.lock();
    db.exec(R"(
        CREATE TABLE IF NOT EXISTS face_descriptors (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            photo_id INTEGER NOT NULL REFERENCES photos(id) ON DELETE CASCADE,
            embedding BLOB NOT NULL,
            dim INTEGER NOT NULL,
            box_x INTEGER NOT NULL CHECK (box_x >= 0),
            box_y INTEGER NOT NULL CHECK (box_y >= 0),
            box_w INTEGER NOT NULL CHECK (box_w >= 0),
            box_h INTEGER NOT NULL CHECK (box_h >= 0),
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_descriptors_photo ON face_descriptors(photo_id);
    )");
}

// ==================== ADD ====================

int64_t DescriptorStore::insert_row(const FaceDescriptor& descriptor) {
    if (descriptor.embedding.size() != embedding_size) {
        throw DimensionMismatch(embedding_size, descriptor.embedding.size());
    }
    if (!descriptor.box.is_valid()) {
        throw StoreError("Bounding box has negative components");
    }

    auto blob = serialize_embedding(descriptor.embedding);

    Statement stmt(db, R"(
        INSERT INTO face_descriptors (photo_id, embedding, dim, box_x, box_y, box_w, box_h, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, descriptor.photo_id)
        .bind_blob(2, blob.data(), blob.size())
        .bind(3, static_cast<int64_t>(descriptor.embedding.size()))
        .bind(4, descriptor.box.x)
        .bind(5, descriptor.box.y)
        .bind(6, descriptor.box.width)
        .bind(7, descriptor.box.height)
        .bind(8, descriptor.created_at.empty() ? current_timestamp() : descriptor.created_at);
    stmt.step();

    return sqlite3_last_insert_rowid(db.handle());
}

int64_t DescriptorStore::add(const FaceDescriptor& descriptor) {
    Transaction tx(db);
    int64_t id = insert_row(descriptor);
    tx.commit();
    return id;
}

int64_t DescriptorStore::add(Transaction& tx, const FaceDescriptor& descriptor) {
    if (!tx.is_active()) {
        throw StoreError("add() requires an active transaction");
    }
    return insert_row(descriptor);
}

std::vector<int64_t> DescriptorStore::add_all(int64_t photo_id, const std::vector<FaceEmbedding>& faces) {
    std::vector<int64_t> ids;
    if (faces.empty()) return ids;

    Transaction tx(db);
    // Stamped under the write lock so it never precedes a closing committed first
    std::string now = current_timestamp();
    for (const auto& face : faces) {
        FaceDescriptor descriptor;
        descriptor.photo_id = photo_id;
        descriptor.embedding = face.embedding;
        descriptor.box = face.box;
        descriptor.created_at = now;
        ids.push_back(insert_row(descriptor));
    }
    tx.commit();

    return ids;
}

// ==================== QUERY ====================

std::vector<FaceDescriptor> DescriptorStore::read_rows(Statement& stmt) const {
    std::vector<FaceDescriptor> rows;

    while (stmt.step()) {
        FaceDescriptor d;
        d.id = stmt.column_int64(0);
        d.photo_id = stmt.column_int64(1);
        d.embedding = deserialize_embedding(stmt.column_blob(2));
        d.box.x = stmt.column_int(3);
        d.box.y = stmt.column_int(4);
        d.box.width = stmt.column_int(5);
        d.box.height = stmt.column_int(6);
        d.created_at = stmt.column_text(7);
        rows.push_back(std::move(d));
    }

    return rows;
}

std::vector<FaceDescriptor> DescriptorStore::all() const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT id, photo_id, embedding, box_x, box_y, box_w, box_h, created_at "
                       "FROM face_descriptors ORDER BY id");
    return read_rows(stmt);
}

std::vector<FaceDescriptor> DescriptorStore::by_photo(int64_t photo_id) const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT id, photo_id, embedding, box_x, box_y, box_w, box_h, created_at "
                       "FROM face_descriptors WHERE photo_id = ? ORDER BY id");
    stmt.bind(1, photo_id);
    return read_rows(stmt);
}

size_t DescriptorStore::count() const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT COUNT(*) FROM face_descriptors");
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

size_t DescriptorStore::count(Transaction& tx) const {
    if (!tx.is_active()) {
        throw StoreError("count() requires an active transaction");
    }
    Statement stmt(db, "SELECT COUNT(*) FROM face_descriptors");
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

size_t DescriptorStore::count_mismatched() const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT COUNT(*) FROM face_descriptors WHERE dim != ?");
    stmt.bind(1, static_cast<int64_t>(embedding_size));
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

// ==================== DELETE ====================

size_t DescriptorStore::delete_by_photo(int64_t photo_id) {
    Transaction tx(db);
    Statement stmt(db, "DELETE FROM face_descriptors WHERE photo_id = ?");
    stmt.bind(1, photo_id);
    stmt.step();
    size_t deleted = static_cast<size_t>(sqlite3_changes(db.handle()));
    tx.commit();

    spdlog::debug("Deleted {} descriptor(s) of photo {}", deleted, photo_id);
    return deleted;
}

size_t DescriptorStore::purge_all() {
    Transaction tx(db);
    size_t purged = purge_all(tx);
    tx.commit();
    return purged;
}

size_t DescriptorStore::purge_all(Transaction& tx) {
    if (!tx.is_active()) {
        throw StoreError("purge_all() requires an active transaction");
    }
    Statement stmt(db, "DELETE FROM face_descriptors");
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(db.handle()));
}
