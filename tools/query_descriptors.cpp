// ============= tools/query_descriptors.cpp =============
/*
 * Read-only inspection of a kioskface database
 *
 * EXAMPLES:
 *   ./build/bin/query_descriptors data/kioskface.db --stats
 *   ./build/bin/query_descriptors data/kioskface.db --photo 42
 *   ./build/bin/query_descriptors data/kioskface.db --recent 10
 *
 * Never prints embedding values.
 */

#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

class DescriptorQueryTool {
private:
    sqlite3* db;

    static std::string text(sqlite3_stmt* stmt, int col) {
        const unsigned char* t = sqlite3_column_text(stmt, col);
        return t ? reinterpret_cast<const char*>(t) : "-";
    }

    sqlite3_stmt* prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(db)));
        }
        return stmt;
    }

    void print_rows(sqlite3_stmt* stmt) {
        std::cout << std::left
                  << std::setw(8) << "ID"
                  << std::setw(8) << "PHOTO"
                  << std::setw(6) << "DIM"
                  << std::setw(22) << "BOX (x,y,w,h)"
                  << "CREATED" << std::endl;
        std::cout << std::string(70, '-') << std::endl;

        int rows = 0;
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            std::string box = std::to_string(sqlite3_column_int(stmt, 3)) + "," +
                              std::to_string(sqlite3_column_int(stmt, 4)) + "," +
                              std::to_string(sqlite3_column_int(stmt, 5)) + "," +
                              std::to_string(sqlite3_column_int(stmt, 6));
            std::cout << std::setw(8) << sqlite3_column_int64(stmt, 0)
                      << std::setw(8) << sqlite3_column_int64(stmt, 1)
                      << std::setw(6) << sqlite3_column_int(stmt, 2)
                      << std::setw(22) << box
                      << text(stmt, 7) << std::endl;
            rows++;
        }
        std::cout << "\n" << rows << " descriptor(s)" << std::endl;
    }

public:
    explicit DescriptorQueryTool(const std::string& path) : db(nullptr) {
        int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            if (db) sqlite3_close(db);
            throw std::runtime_error("Cannot open database: " + msg);
        }
    }

    ~DescriptorQueryTool() {
        if (db) sqlite3_close(db);
    }

    void show_statistics() {
        sqlite3_stmt* stmt = prepare(R"(
            SELECT
                (SELECT COUNT(*) FROM photos),
                COUNT(*),
                COUNT(DISTINCT photo_id),
                MIN(dim), MAX(dim),
                MIN(created_at), MAX(created_at)
            FROM face_descriptors
        )");

        if (sqlite3_step(stmt) == SQLITE_ROW) {
            std::cout << "\n═══════════════════════════════════════════════" << std::endl;
            std::cout << "   DESCRIPTOR STATISTICS" << std::endl;
            std::cout << "═══════════════════════════════════════════════" << std::endl;
            std::cout << "Photos:              " << sqlite3_column_int64(stmt, 0) << std::endl;
            std::cout << "Descriptors:         " << sqlite3_column_int64(stmt, 1) << std::endl;
            std::cout << "Photos with faces:   " << sqlite3_column_int64(stmt, 2) << std::endl;
            std::cout << "Dimension (min/max): " << sqlite3_column_int(stmt, 3) << " / "
                      << sqlite3_column_int(stmt, 4) << std::endl;
            std::cout << "First descriptor:    " << text(stmt, 5) << std::endl;
            std::cout << "Last descriptor:     " << text(stmt, 6) << std::endl;
        }
        sqlite3_finalize(stmt);

        stmt = prepare("SELECT id, closed_at, closing_user FROM closing_reports ORDER BY id DESC LIMIT 1");
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            std::cout << "Last closing:        #" << sqlite3_column_int64(stmt, 0) << " "
                      << text(stmt, 1) << " by " << text(stmt, 2) << std::endl;
        } else {
            std::cout << "Last closing:        never" << std::endl;
        }
        sqlite3_finalize(stmt);
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    void show_photo(int64_t photo_id) {
        sqlite3_stmt* stmt = prepare("SELECT relative_path, photographer, created_at FROM photos WHERE id = ?");
        sqlite3_bind_int64(stmt, 1, photo_id);
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            std::cout << "Photo " << photo_id << " not found" << std::endl;
            return;
        }
        std::cout << "\nPhoto " << photo_id << ": " << text(stmt, 0)
                  << " (" << text(stmt, 1) << ", " << text(stmt, 2) << ")\n" << std::endl;
        sqlite3_finalize(stmt);

        stmt = prepare("SELECT id, photo_id, dim, box_x, box_y, box_w, box_h, created_at "
                       "FROM face_descriptors WHERE photo_id = ? ORDER BY id");
        sqlite3_bind_int64(stmt, 1, photo_id);
        print_rows(stmt);
        sqlite3_finalize(stmt);
    }

    void show_recent(int limit) {
        sqlite3_stmt* stmt = prepare("SELECT id, photo_id, dim, box_x, box_y, box_w, box_h, created_at "
                                     "FROM face_descriptors ORDER BY id DESC LIMIT ?");
        sqlite3_bind_int(stmt, 1, limit);
        std::cout << "\nLast " << limit << " descriptor(s):\n" << std::endl;
        print_rows(stmt);
        sqlite3_finalize(stmt);
    }
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <database.db> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --stats        Counts, dimensions, last closing (default)\n";
    std::cout << "  --photo ID     Descriptors of one photo\n";
    std::cout << "  --recent N     Last N descriptors\n";
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        DescriptorQueryTool tool(argv[1]);
        std::string option = argc >= 3 ? argv[2] : "--stats";

        if (option == "--stats") {
            tool.show_statistics();
        } else if (option == "--photo" && argc >= 4) {
            tool.show_photo(std::stoll(argv[3]));
        } else if (option == "--recent" && argc >= 4) {
            tool.show_recent(std::stoi(argv[3]));
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
