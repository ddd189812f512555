#pragma once

#include "crypto/crypto.h"
#include "core/transfer.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace sigelnet {
namespace core {

constexpr size_t MAX_BLOCK_TRANSFERS = 1000;
constexpr size_t MAX_MINER_ID = 64;

struct Block {
    uint64_t index = 0;
    crypto::Hash256 previousHash{};
    uint64_t timestamp = 0;
    std::string minerId;
    uint64_t nonce = 0;
    uint64_t difficultyTarget = 0;
    double minerScore = 0.0;
    crypto::Hash256 merkleRoot{};
    std::vector<KnowledgeTransfer> transactions;
    crypto::Hash256 hash{};

    // Header encoding without the trailing nonce. Mining hashes
    // prefix || nonce, so the prefix is built once per candidate.
    std::vector<uint8_t> headerPrefix() const;
    static crypto::Hash256 hashHeader(std::vector<uint8_t>& prefix, uint64_t nonce);

    crypto::Hash256 computeHash() const;
    crypto::Hash256 computeMerkleRoot() const;
    // First eight bytes of the hash, big-endian.
    uint64_t hashValue() const;

    std::vector<uint8_t> serialize() const;
    static std::optional<Block> deserialize(const std::vector<uint8_t>& data);
    void writeTo(utils::ByteBuffer& buf) const;
    // Keeps the sender's claimed hash; ledger validation checks it against computeHash().
    static Block readFrom(utils::ByteBuffer& buf);

    std::string hashHex() const { return crypto::toHex(hash); }
};

}
}
