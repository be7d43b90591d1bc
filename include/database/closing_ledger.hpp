/*
 * Closing Ledger - end-of-day accounting record
 *
 * TABLE: closing_reports
 * ├── id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── closed_at (TEXT)
 * ├── total_revenue (REAL)
 * ├── digital_count, print_count (INTEGER)
 * ├── photographer_splits (TEXT, JSON object name -> amount)
 * ├── closing_user (TEXT)
 * └── notes (TEXT)
 *
 * The accounting workflow hands the purge a ClosingWriter; the writer only
 * inserts inside the Transaction it is given, so the closing row and the
 * descriptor purge commit (or roll back) together.
 */

#pragma once
#include "database/database.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// "Commit the closing summary" capability
class ClosingWriter {
public:
    virtual ~ClosingWriter() = default;

    // Writes the closing inside tx and returns its id. Must not commit.
    virtual int64_t commit(Transaction& tx) = 0;
};

struct ClosingSummary {
    double total_revenue = 0.0;
    int digital_count = 0;
    int print_count = 0;
    std::map<std::string, double> photographer_splits;
    std::string closing_user;
    std::string notes;
};

struct ClosingRecord {
    int64_t id = 0;
    std::string closed_at;
    double total_revenue = 0.0;
    int digital_count = 0;
    int print_count = 0;
    std::string photographer_splits;   // JSON
    std::string closing_user;
    std::string notes;
};

class ClosingLedger {
public:
    explicit ClosingLedger(Database& db);

    std::unique_ptr<ClosingWriter> writer(const ClosingSummary& summary);

    std::optional<ClosingRecord> last_closing() const;
    std::vector<ClosingRecord> history() const;   // newest first
    size_t count() const;

private:
    Database& db;

    void create_tables();
};

std::string splits_to_json(const std::map<std::string, double>& splits);
