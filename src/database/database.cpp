#include "database/database.h"
#include <sqlite3.h>
#include <mutex>
#include <stdexcept>

namespace sigelnet {
namespace database {

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
    std::vector<std::string> dels;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::put(const std::string& key, const std::string& value) {
    impl_->puts.emplace_back(key, std::vector<uint8_t>(value.begin(), value.end()));
}

void WriteBatch::del(const std::string& key) {
    impl_->dels.push_back(key);
}

void WriteBatch::clear() {
    impl_->puts.clear();
    impl_->dels.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size() + impl_->dels.size();
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string lastError;
    mutable std::mutex mtx;

    void recordError() {
        lastError = db ? sqlite3_errmsg(db) : "database not open";
    }

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool putLocked(const std::string& key, const std::vector<uint8_t>& value) {
        sqlite3_stmt* stmt = nullptr;
        const char* sql = "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            recordError();
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            recordError();
            return false;
        }
        return true;
    }

    bool delLocked(const std::string& key) {
        sqlite3_stmt* stmt = nullptr;
        const char* sql = "DELETE FROM kv WHERE key = ?;";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            recordError();
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            recordError();
            return false;
        }
        return true;
    }
};

static std::vector<uint8_t> columnBlob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int blobSize = sqlite3_column_bytes(stmt, col);
    if (!blob || blobSize <= 0) return {};
    return std::vector<uint8_t>(static_cast<const uint8_t*>(blob),
                                static_cast<const uint8_t*>(blob) + blobSize);
}

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->recordError();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    const char* createTable =
        "CREATE TABLE IF NOT EXISTS kv ("
        "key TEXT PRIMARY KEY,"
        "value BLOB"
        ");";

    if (!impl_->exec(createTable)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    if (path != ":memory:") {
        impl_->exec("PRAGMA journal_mode=WAL;");
        impl_->exec("PRAGMA synchronous=NORMAL;");
    }

    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->db != nullptr;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->putLocked(key, value);
}

bool Database::put(const std::string& key, const std::string& value) {
    return put(key, std::vector<uint8_t>(value.begin(), value.end()));
}

bool Database::get(const std::string& key, std::vector<uint8_t>& value) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT value FROM kv WHERE key = ?;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = columnBlob(stmt, 0);
        found = true;
    }

    sqlite3_finalize(stmt);
    return found;
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::vector<uint8_t> result;
    get(key, result);
    return result;
}

std::string Database::getString(const std::string& key) const {
    auto data = get(key);
    return std::string(data.begin(), data.end());
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->delLocked(key);
}

bool Database::exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT 1 FROM kv WHERE key = ? LIMIT 1;";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    if (!impl_->exec("BEGIN TRANSACTION;")) return false;

    bool ok = true;
    for (const auto& key : batch.impl_->dels) {
        if (!impl_->delLocked(key)) { ok = false; break; }
    }
    if (ok) {
        for (const auto& [key, value] : batch.impl_->puts) {
            if (!impl_->putLocked(key, value)) { ok = false; break; }
        }
    }

    if (!ok || !impl_->exec("COMMIT;")) {
        std::string err = impl_->lastError;
        impl_->exec("ROLLBACK;");
        impl_->lastError = err;
        return false;
    }

    batch.clear();
    return true;
}

bool Database::forEach(const std::string& prefix,
                       const std::function<bool(const std::string&, const std::vector<uint8_t>&)>& fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt = nullptr;
    std::string sql = "SELECT key, value FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?) = ?";
    }
    sql += " ORDER BY key;";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->recordError();
        return false;
    }

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), static_cast<int>(prefix.size()), SQLITE_STATIC);
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        std::string key = text ? reinterpret_cast<const char*>(text) : "";
        if (!fn(key, columnBlob(stmt, 1))) {
            rc = SQLITE_DONE;
            break;
        }
    }

    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::vector<std::string> Database::keys(const std::string& prefix) const {
    std::vector<std::string> result;
    forEach(prefix, [&result](const std::string& key, const std::vector<uint8_t>&) {
        result.push_back(key);
        return true;
    });
    return result;
}

size_t Database::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    sqlite3_stmt* stmt = nullptr;
    std::string sql = "SELECT COUNT(*) FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?) = ?";
    }
    sql += ";";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), static_cast<int>(prefix.size()), SQLITE_STATIC);
    }

    size_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return cnt;
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

}
}
