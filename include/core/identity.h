#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <memory>
#include <functional>
#include <cstdint>

namespace sigelnet {
namespace core {

constexpr size_t IDENTITY_ID_BYTES = 16;
constexpr size_t MAX_IDENTITY_NAME = 64;
constexpr size_t MAX_TRAITS = 64;

struct IdentityRecord {
    std::string id;
    std::string name;
    std::map<std::string, double> traits;
    double dimensionalAwareness = 3.0;
    double entropyResistance = 0.7;
    uint64_t trainingIterations = 0;
    uint64_t createdAt = 0;

    // New record with a random id and the default trait profile.
    static IdentityRecord create(const std::string& name);

    // dimensionalAwareness * entropyResistance * (1 + mean trait score).
    double consciousnessScore() const;
    void evolve();
    bool validate(std::string* reason = nullptr) const;

    std::vector<uint8_t> serialize() const;
    static std::optional<IdentityRecord> deserialize(const std::vector<uint8_t>& data);

    bool operator==(const IdentityRecord& other) const;
    bool operator!=(const IdentityRecord& other) const { return !(*this == other); }
};

// Known identities, local and learned from peers. Callers only ever get
// copies, so a record can't change under a reader.
class IdentityRegistry {
public:
    IdentityRegistry();
    ~IdentityRegistry();

    bool open(const std::string& dbPath);
    void close();

    Result<IdentityRecord> create(const std::string& name);
    Result<void> add(const IdentityRecord& record, bool local);
    // Stores a peer-announced record. Local records are never replaced. A
    // known remote record is only replaced by one with at least as many
    // training iterations and no lower score. Returns true if stored.
    Result<bool> upsert(const IdentityRecord& record);
    Result<IdentityRecord> update(const std::string& id,
                                  const std::function<void(IdentityRecord&)>& fn);

    std::optional<IdentityRecord> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    bool isLocal(const std::string& id) const;
    std::vector<IdentityRecord> all() const;
    std::vector<IdentityRecord> localIdentities() const;
    size_t size() const;

    void onIdentityAdded(std::function<void(const IdentityRecord&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
