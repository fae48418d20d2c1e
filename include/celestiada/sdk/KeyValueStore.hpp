#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "NamespacedMerkleTree.hpp"
#include <map>
#include <shared_mutex>
#include <string>

namespace celestiada {
namespace sdk {

/**
 * @brief Hash-keyed byte store backing the preimage relation
 *
 * Implementations must be safe to call from several threads at once.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual Result<void> put(const Hash32& key, const ByteVector& value) = 0;

    // NOT_FOUND when the key is absent, FILE_IO_ERROR/STORAGE_ERROR otherwise
    virtual Result<ByteVector> get(const Hash32& key) const = 0;

    virtual bool has(const Hash32& key) const = 0;
};

/**
 * @brief In-memory store guarded by a shared mutex
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    Result<void> put(const Hash32& key, const ByteVector& value) override;
    Result<ByteVector> get(const Hash32& key) const override;
    bool has(const Hash32& key) const override;

    // Drop an entry; returns false if it was not present
    bool erase(const Hash32& key);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<Hash32, ByteVector> entries_;
};

/**
 * @brief Directory of files, one per key, named by the key's hex encoding
 *
 * Writes go to a temporary file which is renamed into place, so a reader
 * never observes a partially written value.
 */
class LocalFileStorageService : public KeyValueStore {
public:
    LocalFileStorageService(const std::string& data_dir = constants::DATA_DIR);

    Result<void> put(const Hash32& key, const ByteVector& value) override;
    Result<ByteVector> get(const Hash32& key) const override;
    bool has(const Hash32& key) const override;

    // Store under the content hash of value and return that hash
    Result<Hash32> put_content(const ByteVector& value);

    static Hash32 content_hash(const ByteVector& value);

    // File name of a key: lowercase hex without prefix
    static std::string encode_key(const Hash32& key);

    const std::string& data_dir() const { return data_dir_; }

    std::string to_string() const;

private:
    // Name used by older deployments; read-only fallback
    static std::string legacy_key_name(const Hash32& key);

    std::string data_dir_;
};

// Adapters between a store and the NMT callback contracts
PreimageRecorder make_preimage_recorder(KeyValueStore& store);
PreimageOracle make_preimage_oracle(const KeyValueStore& store);

} // namespace sdk
} // namespace celestiada
