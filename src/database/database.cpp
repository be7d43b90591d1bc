#include "database/database.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

Database::Database(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("🗄️  Opening database: {}", db_path);

    if (!in_memory()) {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw StoreError("Cannot open database " + db_path + ": " + msg);
    }

    sqlite3_busy_timeout(db, 5000);

    try {
        auto guard = lock();
        exec("PRAGMA foreign_keys=ON;");
        exec("PRAGMA secure_delete=ON;");
        if (!in_memory()) {
            exec("PRAGMA journal_mode=WAL;");
            exec("PRAGMA synchronous=FULL;");
        }
    } catch (const StoreError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

Database::~Database() {
    if (db) {
        sqlite3_close(db);
    }
}

bool Database::in_memory() const {
    return db_path.empty() || db_path == ":memory:" || db_path.rfind("file::memory:", 0) == 0;
}

// ==================== EXEC ====================

void Database::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StoreError("SQL error: " + msg);
    }
}

void Database::checkpoint() {
    if (in_memory()) return;

    auto guard = lock();
    int rc = sqlite3_wal_checkpoint_v2(db, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError("WAL checkpoint failed: " + last_error());
    }
}

std::string Database::last_error() const {
    return db ? sqlite3_errmsg(db) : "database closed";
}

// ==================== TRANSACTION ====================

Transaction::Transaction(Database& database)
    : db(database), lock(database.lock()), active(false)
{
    db.exec("BEGIN IMMEDIATE;");
    active = true;
}

Transaction::~Transaction() {
    if (!active) return;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db.handle(), "ROLLBACK;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        spdlog::error("ROLLBACK failed: {}", err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
    }
}

void Transaction::commit() {
    if (!active) {
        throw StoreError("Transaction already finished");
    }
    db.exec("COMMIT;");
    active = false;
}

// ==================== STATEMENT ====================

Statement::Statement(const Database& database, const char* sql)
    : db(database), stmt(nullptr)
{
    int rc = sqlite3_prepare_v2(db.handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError("Failed to prepare statement: " + db.last_error());
    }
}

Statement::~Statement() {
    if (stmt) sqlite3_finalize(stmt);
}

Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK) {
        throw StoreError("bind failed: " + db.last_error());
    }
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<int64_t>(value));
}

Statement& Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt, index, value) != SQLITE_OK) {
        throw StoreError("bind failed: " + db.last_error());
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError("bind failed: " + db.last_error());
    }
    return *this;
}

Statement& Statement::bind_blob(int index, const void* data, size_t size) {
    if (sqlite3_bind_blob(stmt, index, data, static_cast<int>(size), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError("bind failed: " + db.last_error());
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError("Statement failed: " + db.last_error());
}

void Statement::reset() {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt, col);
}

int Statement::column_int(int col) const {
    return sqlite3_column_int(stmt, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::vector<unsigned char> Statement::column_blob(int col) const {
    const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
    int size = sqlite3_column_bytes(stmt, col);
    if (!data || size <= 0) return {};
    return std::vector<unsigned char>(data, data + size);
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    std::memcpy(blob.data(), emb.data(), blob.size());
    return blob;
}

std::vector<float> deserialize_embedding(const std::vector<unsigned char>& blob) {
    if (blob.size() % sizeof(float) != 0) {
        throw StoreError("Corrupt embedding blob (" + std::to_string(blob.size()) + " bytes)");
    }
    std::vector<float> emb(blob.size() / sizeof(float));
    std::memcpy(emb.data(), blob.data(), blob.size());
    return emb;
}
