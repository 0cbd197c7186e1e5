#include "nearfetch/storage/file_index.hpp"
#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"
#include <sqlite3.h>
#include <memory>

namespace nearfetch::storage {

using nearfetch::transfer::TransferError;
using nearfetch::transfer::TransferResult;
using nearfetch::core::utils::TimeUtils;

namespace {

const char* const SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS files (
        file_id TEXT PRIMARY KEY,
        file_path TEXT NOT NULL,
        file_size INTEGER NOT NULL,
        added_at INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_files_added_at ON files(added_at);
)";

const char* const FILE_COLUMNS = "SELECT file_id, file_path, file_size, added_at FROM files";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare '{}': {}", sql, sqlite3_errmsg(db));
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return Statement(stmt);
}

void bind_text(const Statement& stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt.get(), index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

SharedFile read_row(const Statement& stmt) {
    auto text = [&stmt](int column) {
        auto value = sqlite3_column_text(stmt.get(), column);
        return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
    };

    SharedFile file;
    file.file_id = text(0);
    file.file_path = text(1);
    file.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2));
    file.added_at = TimeUtils::from_unix_seconds(sqlite3_column_int64(stmt.get(), 3));
    return file;
}

}

FileIndex::FileIndex(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

FileIndex::~FileIndex() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool FileIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return true;
    }

    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        LOG_ERROR("Failed to open file index {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_DEBUG("File index opened at {}", db_path_.string());
    return true;
}

bool FileIndex::is_open() const {
    return db_ != nullptr;
}

bool FileIndex::create_tables() {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, SCHEMA, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        LOG_ERROR("Failed to create file index schema: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

// Re-sharing an identifier points it at the new file.
bool FileIndex::add_file(const SharedFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    auto stmt = prepare(db_, "INSERT OR REPLACE INTO files (file_id, file_path, file_size, added_at) "
                             "VALUES (?, ?, ?, ?);");
    if (!stmt) {
        return false;
    }

    bind_text(stmt, 1, file.file_id);
    bind_text(stmt, 2, file.file_path.string());
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(file.file_size));
    sqlite3_bind_int64(stmt.get(), 4, TimeUtils::unix_seconds(file.added_at));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        LOG_ERROR("Failed to index {}: {}", file.file_id, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

TransferResult FileIndex::remove_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return TransferResult(TransferError::INVALID_STATE, "File index is not open");
    }

    auto stmt = prepare(db_, "DELETE FROM files WHERE file_id = ?;");
    if (!stmt) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, "Failed to prepare delete statement");
    }

    bind_text(stmt, 1, file_id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return TransferResult(TransferError::FILE_UNAVAILABLE,
                              std::string("Failed to remove file from index: ") + sqlite3_errmsg(db_));
    }

    if (sqlite3_changes(db_) == 0) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, "File not indexed: " + file_id);
    }
    return TransferResult(TransferError::SUCCESS);
}

std::optional<SharedFile> FileIndex::get_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    auto stmt = prepare(db_, std::string(FILE_COLUMNS) + " WHERE file_id = ?;");
    if (!stmt) {
        return std::nullopt;
    }

    bind_text(stmt, 1, file_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_row(stmt);
}

std::vector<SharedFile> FileIndex::list_files() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SharedFile> files;
    if (!db_) {
        return files;
    }

    auto stmt = prepare(db_, std::string(FILE_COLUMNS) + " ORDER BY added_at DESC, file_id;");
    if (!stmt) {
        return files;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        files.push_back(read_row(stmt));
    }
    return files;
}

bool FileIndex::file_exists(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    auto stmt = prepare(db_, "SELECT 1 FROM files WHERE file_id = ? LIMIT 1;");
    if (!stmt) {
        return false;
    }

    bind_text(stmt, 1, file_id);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

size_t FileIndex::get_file_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    auto stmt = prepare(db_, "SELECT COUNT(*) FROM files;");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace nearfetch::storage
