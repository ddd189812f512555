#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace sigelnet {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void put(const std::string& key, const std::string& value);
    void del(const std::string& key);
    void clear();
    size_t size() const;
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// SQLite-backed key/value store. A path of ":memory:" opens a private
// in-memory database.
class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    bool put(const std::string& key, const std::string& value);
    bool get(const std::string& key, std::vector<uint8_t>& value) const;
    std::vector<uint8_t> get(const std::string& key) const;
    std::string getString(const std::string& key) const;
    bool del(const std::string& key);
    bool exists(const std::string& key) const;

    // Applies every put and delete in one transaction; rolls back on any failure.
    bool write(WriteBatch& batch);

    bool forEach(const std::string& prefix,
                 const std::function<bool(const std::string&, const std::vector<uint8_t>&)>& fn) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t count(const std::string& prefix = "") const;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
