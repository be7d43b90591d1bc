/*
 * SQLite connection shared by the pipeline
 *
 * - One connection, serialized by db_mutex
 * - PRAGMA foreign_keys=ON (descriptor -> photo cascade)
 * - PRAGMA secure_delete=ON (deleted rows are zeroed on disk)
 * - WAL + synchronous=FULL for file databases
 *
 * Transaction holds db_mutex for its whole lifetime, so nothing else can
 * read or write the connection between BEGIN and COMMIT/ROLLBACK.
 */

#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

class Database {
public:
    explicit Database(const std::string& db_path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    sqlite3* handle() const { return db; }
    const std::string& path() const { return db_path; }
    bool in_memory() const;

    std::unique_lock<std::mutex> lock() const { return std::unique_lock<std::mutex>(db_mutex); }

    // Caller must hold the lock (or a Transaction)
    void exec(const std::string& sql);

    // Flush and truncate the WAL so deleted pages do not survive in the journal
    void checkpoint();

    std::string last_error() const;

private:
    sqlite3* db;
    std::string db_path;
    mutable std::mutex db_mutex;
};

// ==================== TRANSACTION ====================

class Transaction {
public:
    explicit Transaction(Database& database);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    bool is_active() const { return active; }

    Database& database() { return db; }

private:
    Database& db;
    std::unique_lock<std::mutex> lock;
    bool active;
};

// ==================== STATEMENT ====================

class Statement {
public:
    Statement(const Database& database, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind_blob(int index, const void* data, size_t size);

    // true = row available, false = done. Throws StoreError otherwise.
    bool step();
    void reset();

    int64_t column_int64(int col) const;
    int column_int(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    std::vector<unsigned char> column_blob(int col) const;

private:
    const Database& db;
    sqlite3_stmt* stmt;
};

// ==================== EMBEDDING BLOB ====================

std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
std::vector<float> deserialize_embedding(const std::vector<unsigned char>& blob);
