/**
 * @file KeyValueStore.cpp
 * @brief In-memory and file-backed preimage stores
 */

#include "celestiada/sdk/KeyValueStore.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <sodium.h>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace celestiada {
namespace sdk {

Result<void> MemoryKeyValueStore::put(const Hash32& key, const ByteVector& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = value;
    return ErrorCode::SUCCESS;
}

Result<ByteVector> MemoryKeyValueStore::get(const Hash32& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return {ErrorCode::NOT_FOUND, bytes_to_hex(key)};
    }
    return it->second;
}

bool MemoryKeyValueStore::has(const Hash32& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(key) != 0;
}

bool MemoryKeyValueStore::erase(const Hash32& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(key) != 0;
}

size_t MemoryKeyValueStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

LocalFileStorageService::LocalFileStorageService(const std::string& data_dir)
    : data_dir_(data_dir) {
    if (sodium_init() < 0) {
        Logger::instance().critical("Failed to initialize libsodium for LocalFileStorageService");
        throw std::runtime_error("Failed to initialize libsodium");
    }

    // Create directories if they don't exist
    std::filesystem::create_directories(data_dir_);
}

Hash32 LocalFileStorageService::content_hash(const ByteVector& value) {
    Hash32 hash;
    crypto_generichash(hash.data(), hash.size(), value.data(), value.size(), nullptr, 0);
    return hash;
}

std::string LocalFileStorageService::encode_key(const Hash32& key) {
    return bytes_to_hex(key);
}

std::string LocalFileStorageService::legacy_key_name(const Hash32& key) {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : key) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    while (out.size() % 8 != 0) {
        out.push_back('=');
    }
    return out;
}

Result<void> LocalFileStorageService::put(const Hash32& key, const ByteVector& value) {
    std::string file_name = encode_key(key);
    std::filesystem::path final_path = std::filesystem::path(data_dir_) / file_name;

    Logger::instance().trace("LocalFileStorageService::put key=" + file_name + " " + to_string());

    try {
        // Write to a temp file and rename for an atomic replace
        boost::uuids::random_generator uuid_generator;
        std::filesystem::path temp_path = std::filesystem::path(data_dir_) /
            (file_name + "." + boost::uuids::to_string(uuid_generator()) + ".tmp");

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                Logger::instance().error("Failed to open temp file for writing: " + temp_path.string());
                return {ErrorCode::FILE_IO_ERROR, temp_path.string()};
            }

            file.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
            file.close();
            if (!file) {
                Logger::instance().error("Failed to write temp file: " + temp_path.string());
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                return {ErrorCode::FILE_IO_ERROR, temp_path.string()};
            }
        }

        std::filesystem::permissions(temp_path,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec) {
            Logger::instance().error("Failed to rename " + temp_path.string() + " into place: " + ec.message());
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            return {ErrorCode::FILE_IO_ERROR, ec.message()};
        }

        return ErrorCode::SUCCESS;

    } catch (const std::exception& e) {
        Logger::instance().error("Exception during key-value storage: " + std::string(e.what()));
        return {ErrorCode::STORAGE_ERROR, e.what()};
    }
}

Result<ByteVector> LocalFileStorageService::get(const Hash32& key) const {
    std::string file_name = encode_key(key);

    Logger::instance().trace("LocalFileStorageService::get key=" + file_name + " " + to_string());

    try {
        std::filesystem::path path = std::filesystem::path(data_dir_) / file_name;
        if (!std::filesystem::exists(path)) {
            path = std::filesystem::path(data_dir_) / legacy_key_name(key);
            if (!std::filesystem::exists(path)) {
                return {ErrorCode::NOT_FOUND, file_name};
            }
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            Logger::instance().error("Failed to open file for reading: " + path.string());
            return {ErrorCode::FILE_IO_ERROR, path.string()};
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        ByteVector data(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
            Logger::instance().error("Failed to read file: " + path.string());
            return {ErrorCode::FILE_IO_ERROR, path.string()};
        }

        return data;

    } catch (const std::exception& e) {
        Logger::instance().error("Exception during key-value lookup: " + std::string(e.what()));
        return {ErrorCode::STORAGE_ERROR, e.what()};
    }
}

bool LocalFileStorageService::has(const Hash32& key) const {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(data_dir_) / encode_key(key), ec) ||
           std::filesystem::exists(std::filesystem::path(data_dir_) / legacy_key_name(key), ec);
}

Result<Hash32> LocalFileStorageService::put_content(const ByteVector& value) {
    Hash32 key = content_hash(value);
    auto result = put(key, value);
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }
    return key;
}

std::string LocalFileStorageService::to_string() const {
    return "LocalFileStorageService(" + data_dir_ + ")";
}

PreimageRecorder make_preimage_recorder(KeyValueStore& store) {
    return [&store](const Hash32& digest, const ByteVector& preimage) {
        return store.put(digest, preimage);
    };
}

PreimageOracle make_preimage_oracle(const KeyValueStore& store) {
    return [&store](const Hash32& digest) {
        return store.get(digest);
    };
}

} // namespace sdk
} // namespace celestiada
