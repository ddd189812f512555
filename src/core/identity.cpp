#include "core/identity.h"
#include "crypto/crypto.h"
#include "database/database.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <mutex>
#include <unordered_map>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace sigelnet {
namespace core {

static constexpr uint8_t IDENTITY_FORMAT = 1;
static const char* IDENTITY_PREFIX = "identity:";

static uint64_t nowSeconds() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

IdentityRecord IdentityRecord::create(const std::string& name) {
    IdentityRecord r;
    r.id = crypto::toHex(crypto::randomBytes(IDENTITY_ID_BYTES));
    r.name = name;
    r.traits = {
        {"curiosity", 0.8},
        {"wisdom", 0.5},
        {"creativity", 0.7},
        {"logic", 0.9}
    };
    r.dimensionalAwareness = 3.0;
    r.entropyResistance = 0.7;
    r.trainingIterations = 0;
    r.createdAt = nowSeconds();
    return r;
}

double IdentityRecord::consciousnessScore() const {
    double mean = 0.0;
    if (!traits.empty()) {
        double sum = 0.0;
        for (const auto& [trait, value] : traits) sum += value;
        mean = sum / static_cast<double>(traits.size());
    }
    return dimensionalAwareness * entropyResistance * (1.0 + mean);
}

void IdentityRecord::evolve() {
    trainingIterations++;
    dimensionalAwareness *= 1.001;
}

bool IdentityRecord::validate(std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (id.size() != IDENTITY_ID_BYTES * 2 || !crypto::isHex(id)) return fail("malformed id");
    if (name.empty() || name.size() > MAX_IDENTITY_NAME) return fail("bad name length");
    if (traits.size() > MAX_TRAITS) return fail("too many traits");
    for (const auto& [trait, value] : traits) {
        if (trait.empty()) return fail("empty trait name");
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) return fail("trait out of range: " + trait);
    }
    if (!std::isfinite(dimensionalAwareness) || dimensionalAwareness < 0.0) {
        return fail("dimensional awareness out of range");
    }
    if (!std::isfinite(entropyResistance) || entropyResistance < 0.0 || entropyResistance > 1.0) {
        return fail("entropy resistance out of range");
    }
    return true;
}

std::vector<uint8_t> IdentityRecord::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(IDENTITY_FORMAT);
    buf.writeString(id);
    buf.writeString(name);
    buf.writeVarInt(traits.size());
    for (const auto& [trait, value] : traits) {
        buf.writeString(trait);
        buf.writeDouble(value);
    }
    buf.writeDouble(dimensionalAwareness);
    buf.writeDouble(entropyResistance);
    buf.writeUint64(trainingIterations);
    buf.writeUint64(createdAt);
    return buf.release();
}

std::optional<IdentityRecord> IdentityRecord::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != IDENTITY_FORMAT) return std::nullopt;

        IdentityRecord r;
        r.id = buf.readString();
        r.name = buf.readString();
        uint64_t traitCount = buf.readVarInt();
        if (traitCount > MAX_TRAITS) return std::nullopt;
        for (uint64_t i = 0; i < traitCount; i++) {
            std::string trait = buf.readString();
            r.traits[trait] = buf.readDouble();
        }
        r.dimensionalAwareness = buf.readDouble();
        r.entropyResistance = buf.readDouble();
        r.trainingIterations = buf.readUint64();
        r.createdAt = buf.readUint64();
        if (!buf.atEnd()) return std::nullopt;
        return r;
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

bool IdentityRecord::operator==(const IdentityRecord& other) const {
    return id == other.id && name == other.name && traits == other.traits &&
           dimensionalAwareness == other.dimensionalAwareness &&
           entropyResistance == other.entropyResistance &&
           trainingIterations == other.trainingIterations &&
           createdAt == other.createdAt;
}

struct IdentityEntry {
    IdentityRecord record;
    bool local = false;
};

struct IdentityRegistry::Impl {
    database::Database db;
    std::unordered_map<std::string, IdentityEntry> entries;
    std::function<void(const IdentityRecord&)> addedCallback;
    mutable std::mutex mtx;

    void persist(const IdentityEntry& entry);
};

void IdentityRegistry::Impl::persist(const IdentityEntry& entry) {
    if (!db.isOpen()) return;
    std::vector<uint8_t> value;
    value.push_back(entry.local ? 1 : 0);
    auto body = entry.record.serialize();
    value.insert(value.end(), body.begin(), body.end());
    if (!db.put(IDENTITY_PREFIX + entry.record.id, value)) {
        throw StorageError("identity store write failed: " + db.lastError());
    }
}

IdentityRegistry::IdentityRegistry() : impl_(std::make_unique<Impl>()) {}

IdentityRegistry::~IdentityRegistry() {
    close();
}

bool IdentityRegistry::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db.open(dbPath)) {
        utils::Logger::error("Failed to open identity store " + dbPath + ": " + impl_->db.lastError());
        return false;
    }

    size_t loaded = 0;
    size_t skipped = 0;
    impl_->db.forEach(IDENTITY_PREFIX, [&](const std::string& key, const std::vector<uint8_t>& value) {
        if (value.empty()) { skipped++; return true; }
        std::vector<uint8_t> body(value.begin() + 1, value.end());
        auto rec = IdentityRecord::deserialize(body);
        if (!rec || !rec->validate()) { skipped++; return true; }
        IdentityEntry entry;
        entry.record = *rec;
        entry.local = value[0] != 0;
        impl_->entries[rec->id] = entry;
        loaded++;
        return true;
    });

    if (skipped > 0) {
        utils::Logger::warn("Skipped " + std::to_string(skipped) + " unreadable identity records");
    }
    utils::Logger::info("Loaded " + std::to_string(loaded) + " identities");
    return true;
}

void IdentityRegistry::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->db.close();
}

Result<IdentityRecord> IdentityRegistry::create(const std::string& name) {
    if (name.empty() || name.size() > MAX_IDENTITY_NAME) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "identity name must be 1-64 bytes");
    }
    IdentityRecord record = IdentityRecord::create(name);
    auto res = add(record, true);
    if (!res.ok()) return res.error();
    return record;
}

Result<void> IdentityRegistry::add(const IdentityRecord& record, bool local) {
    std::string reason;
    if (!record.validate(&reason)) {
        return makeError(ErrorCode::VALIDATION_ERROR, "invalid identity: " + reason);
    }

    std::function<void(const IdentityRecord&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (impl_->entries.count(record.id)) {
            return makeError(ErrorCode::ALREADY_EXISTS, "identity already known: " + record.id);
        }
        IdentityEntry entry;
        entry.record = record;
        entry.local = local;
        impl_->persist(entry);
        impl_->entries[record.id] = entry;
        cb = impl_->addedCallback;
    }

    if (cb) cb(record);
    return Result<void>();
}

Result<bool> IdentityRegistry::upsert(const IdentityRecord& record) {
    std::string reason;
    if (!record.validate(&reason)) {
        return makeError(ErrorCode::VALIDATION_ERROR, "invalid identity: " + reason);
    }

    bool added = false;
    std::function<void(const IdentityRecord&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->entries.find(record.id);
        if (it != impl_->entries.end()) {
            IdentityEntry& existing = it->second;
            if (existing.local || existing.record == record) return false;
            if (record.trainingIterations < existing.record.trainingIterations) return false;
            // Blocks already accepted were checked against the stored score.
            if (record.consciousnessScore() < existing.record.consciousnessScore()) return false;
            IdentityEntry updated = existing;
            updated.record = record;
            impl_->persist(updated);
            existing = updated;
        } else {
            IdentityEntry entry;
            entry.record = record;
            entry.local = false;
            impl_->persist(entry);
            impl_->entries[record.id] = entry;
            added = true;
            cb = impl_->addedCallback;
        }
    }

    if (added && cb) cb(record);
    return true;
}

Result<IdentityRecord> IdentityRegistry::update(const std::string& id,
                                                const std::function<void(IdentityRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end()) {
        return makeError(ErrorCode::NOT_FOUND, "unknown identity: " + id);
    }

    IdentityEntry updated = it->second;
    uint64_t iterations = updated.record.trainingIterations;
    fn(updated.record);
    updated.record.id = id;

    std::string reason;
    if (!updated.record.validate(&reason)) {
        return makeError(ErrorCode::VALIDATION_ERROR, "update rejected: " + reason);
    }
    if (updated.record.trainingIterations < iterations) {
        return makeError(ErrorCode::VALIDATION_ERROR, "training iterations cannot decrease");
    }

    impl_->persist(updated);
    it->second = updated;
    return updated.record;
}

std::optional<IdentityRecord> IdentityRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end()) return std::nullopt;
    return it->second.record;
}

bool IdentityRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.count(id) > 0;
}

bool IdentityRegistry::isLocal(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->entries.find(id);
    return it != impl_->entries.end() && it->second.local;
}

std::vector<IdentityRecord> IdentityRegistry::all() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<IdentityRecord> result;
    result.reserve(impl_->entries.size());
    for (const auto& [id, entry] : impl_->entries) result.push_back(entry.record);
    return result;
}

std::vector<IdentityRecord> IdentityRegistry::localIdentities() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<IdentityRecord> result;
    for (const auto& [id, entry] : impl_->entries) {
        if (entry.local) result.push_back(entry.record);
    }
    return result;
}

size_t IdentityRegistry::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.size();
}

void IdentityRegistry::onIdentityAdded(std::function<void(const IdentityRecord&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->addedCallback = std::move(callback);
}

}
}
