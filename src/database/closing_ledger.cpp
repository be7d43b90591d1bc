#include "database/closing_ledger.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace {

class SqliteClosingWriter : public ClosingWriter {
public:
    explicit SqliteClosingWriter(const ClosingSummary& summary) : summary(summary) {}

    int64_t commit(Transaction& tx) override {
        if (!tx.is_active()) {
            throw StoreError("Closing write requires an active transaction");
        }

        Database& db = tx.database();
        Statement stmt(db, R"(
            INSERT INTO closing_reports
                (closed_at, total_revenue, digital_count, print_count,
                 photographer_splits, closing_user, notes)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        stmt.bind(1, current_timestamp())
            .bind(2, summary.total_revenue)
            .bind(3, summary.digital_count)
            .bind(4, summary.print_count)
            .bind(5, splits_to_json(summary.photographer_splits))
            .bind(6, summary.closing_user)
            .bind(7, summary.notes);
        stmt.step();

        return sqlite3_last_insert_rowid(db.handle());
    }

private:
    ClosingSummary summary;
};

ClosingRecord read_record(const Statement& stmt) {
    ClosingRecord r;
    r.id = stmt.column_int64(0);
    r.closed_at = stmt.column_text(1);
    r.total_revenue = stmt.column_double(2);
    r.digital_count = stmt.column_int(3);
    r.print_count = stmt.column_int(4);
    r.photographer_splits = stmt.column_text(5);
    r.closing_user = stmt.column_text(6);
    r.notes = stmt.column_text(7);
    return r;
}

const char* SELECT_CLOSINGS =
    "SELECT id, closed_at, total_revenue, digital_count, print_count, "
    "photographer_splits, closing_user, notes FROM closing_reports ";

} // namespace

ClosingLedger::ClosingLedger(Database& db)
    : db(db)
{
    create_tables();
}

void ClosingLedger::create_tables() {
    auto lock = db.lock();
    db.exec(R"(
        CREATE TABLE IF NOT EXISTS closing_reports (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            closed_at TEXT NOT NULL,
            total_revenue REAL NOT NULL DEFAULT 0,
            digital_count INTEGER NOT NULL DEFAULT 0,
            print_count INTEGER NOT NULL DEFAULT 0,
            photographer_splits TEXT NOT NULL DEFAULT '{}',
            closing_user TEXT,
            notes TEXT
        );
    )");
}

std::unique_ptr<ClosingWriter> ClosingLedger::writer(const ClosingSummary& summary) {
    return std::make_unique<SqliteClosingWriter>(summary);
}

std::optional<ClosingRecord> ClosingLedger::last_closing() const {
    auto lock = db.lock();
    Statement stmt(db, (std::string(SELECT_CLOSINGS) + "ORDER BY id DESC LIMIT 1").c_str());
    if (!stmt.step()) return std::nullopt;
    return read_record(stmt);
}

std::vector<ClosingRecord> ClosingLedger::history() const {
    auto lock = db.lock();
    Statement stmt(db, (std::string(SELECT_CLOSINGS) + "ORDER BY id DESC").c_str());

    std::vector<ClosingRecord> records;
    while (stmt.step()) {
        records.push_back(read_record(stmt));
    }
    return records;
}

size_t ClosingLedger::count() const {
    auto lock = db.lock();
    Statement stmt(db, "SELECT COUNT(*) FROM closing_reports");
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

std::string splits_to_json(const std::map<std::string, double>& splits) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(15) << "{";
    bool first = true;
    for (const auto& [name, amount] : splits) {
        if (!std::isfinite(amount)) {
            throw StoreError("Photographer split for '" + name + "' is not a finite amount");
        }
        if (!first) out << ",";
        out << "\"" << json_escape(name) << "\":" << amount;
        first = false;
    }
    out << "}";
    return out.str();
}
