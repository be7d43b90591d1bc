#include "database/photo_catalog.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

PhotoCatalog::PhotoCatalog(Database& db)
    : db(db)
{
    create_tables();
}

void PhotoCatalog::create_tables() {
    auto lock = db.lock();
    db.exec(R"(
        CREATE TABLE IF NOT EXISTS photos (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            filename TEXT NOT NULL,
            relative_path TEXT NOT NULL,
            photographer TEXT,
            created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        );
        CREATE INDEX IF NOT EXISTS idx_photos_created ON photos(created_at);
    )");
}

int64_t PhotoCatalog::add(const std::string& relative_path, const std::string& photographer) {
    std::string filename = std::filesystem::path(relative_path).filename().string();

    auto lock = db.lock();
    Statement stmt(db, "INSERT INTO photos (filename, relative_path, photographer, created_at) "
                       "VALUES (?, ?, ?, ?)");
    stmt.bind(1, filename)
        .bind(2, relative_path)
        .bind(3, photographer)
        .bind(4, current_timestamp());
    stmt.step();

    int64_t photo_id = sqlite3_last_insert_rowid(db.handle());
    spdlog::debug("Photo registered: {} (ID={})", relative_path, photo_id);
    return photo_id;
}

std::optional<Photo> PhotoCatalog::find(int64_t photo_id) const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT id, filename, relative_path, photographer, created_at "
                       "FROM photos WHERE id = ?");
    stmt.bind(1, photo_id);

    if (!stmt.step()) return std::nullopt;

    Photo photo;
    photo.id = stmt.column_int64(0);
    photo.filename = stmt.column_text(1);
    photo.relative_path = stmt.column_text(2);
    photo.photographer = stmt.column_text(3);
    photo.created_at = stmt.column_text(4);
    return photo;
}

std::map<int64_t, Photo> PhotoCatalog::find_many(const std::vector<int64_t>& photo_ids) const {
    std::map<int64_t, Photo> photos;
    if (photo_ids.empty()) return photos;

    auto lock = db.lock();
    Statement stmt(db, "SELECT id, filename, relative_path, photographer, created_at "
                       "FROM photos WHERE id = ?");

    for (int64_t id : photo_ids) {
        if (photos.count(id)) continue;

        stmt.reset();
        stmt.bind(1, id);
        if (stmt.step()) {
            Photo photo;
            photo.id = stmt.column_int64(0);
            photo.filename = stmt.column_text(1);
            photo.relative_path = stmt.column_text(2);
            photo.photographer = stmt.column_text(3);
            photo.created_at = stmt.column_text(4);
            photos.emplace(id, std::move(photo));
        }
    }

    return photos;
}

bool PhotoCatalog::remove(int64_t photo_id) {
    auto lock = db.lock();
    Statement stmt(db, "DELETE FROM photos WHERE id = ?");
    stmt.bind(1, photo_id);
    stmt.step();

    bool removed = sqlite3_changes(db.handle()) > 0;
    if (removed) {
        spdlog::info("✓ Deleted photo ID={} (descriptors cascaded)", photo_id);
    }
    return removed;
}

size_t PhotoCatalog::count() const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT COUNT(*) FROM photos");
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}
