#include "cache/cache_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>
#include <zlib.h>

namespace CIP {
namespace Cache {

namespace {

constexpr char MAGIC[4] = {'C', 'I', 'P', 'C'};
constexpr uint8_t FORMAT_VERSION = 1;
constexpr size_t HEADER_SIZE = sizeof(MAGIC) + 1 + 4 + 8;
constexpr size_t MAX_FILENAME_STEM = 180;

void appendLE(std::string& out, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

uint64_t readLE(const std::string& in, size_t offset, size_t bytes) {
    uint64_t value = 0;
    for (size_t i = 0; i < bytes; ++i) {
        value |= static_cast<uint64_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
    }
    return value;
}

std::string hex32(uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

} // namespace

DirectoryCacheStore::DirectoryCacheStore(const std::string& directory, int compression_level)
    : directory_(directory), compression_level_(compression_level) {
    if (compression_level_ < 0 || compression_level_ > 9) {
        throw std::invalid_argument("Compression level must be between 0 and 9");
    }
}

uint32_t DirectoryCacheStore::checksum(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

std::string DirectoryCacheStore::compress(const std::string& data, int level) {
    z_stream zs;
    memset(&zs, 0, sizeof(zs));

    if (deflateInit(&zs, level) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compression");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string compressed;
    char buffer[32768];
    int ret;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("Failed to compress data");
        }
        compressed.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return compressed;
}

std::optional<std::string> DirectoryCacheStore::decompress(const std::string& data, size_t expected_size) {
    z_stream zs;
    memset(&zs, 0, sizeof(zs));

    if (inflateInit(&zs) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string decompressed;
    decompressed.reserve(expected_size);
    char buffer[32768];
    int ret;

    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }
        decompressed.append(buffer, sizeof(buffer) - zs.avail_out);
        if (decompressed.size() > expected_size) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    if (decompressed.size() != expected_size) {
        return std::nullopt;
    }
    return decompressed;
}

std::filesystem::path DirectoryCacheStore::pathForKey(const std::string& key) const {
    std::string stem;
    stem.reserve(key.size());
    for (char c : key) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '.';
        stem.push_back(safe ? c : '_');
    }
    if (!stem.empty() && stem[0] == '.') {
        stem[0] = '_';
    }

    if (stem != key || stem.size() > MAX_FILENAME_STEM) {
        stem = stem.substr(0, MAX_FILENAME_STEM) + "-" + hex32(checksum(key));
    }
    return directory_ / (stem + ".cache");
}

std::optional<std::string> DirectoryCacheStore::get(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.gets++;
    }

    auto path = pathForKey(key);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.misses++;
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    auto corrupt = [&](const std::string& reason) -> std::optional<std::string> {
        LOG_WARN("cache_store", "Ignoring corrupt cache entry " + path.string() + ": " + reason);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.corrupt_entries++;
        stats_.misses++;
        return std::nullopt;
    };

    if (content.size() < HEADER_SIZE || std::memcmp(content.data(), MAGIC, sizeof(MAGIC)) != 0) {
        return corrupt("bad header");
    }
    if (static_cast<uint8_t>(content[sizeof(MAGIC)]) != FORMAT_VERSION) {
        return corrupt("unsupported format version");
    }

    const uint32_t expected_crc = static_cast<uint32_t>(readLE(content, sizeof(MAGIC) + 1, 4));
    const uint64_t raw_size = readLE(content, sizeof(MAGIC) + 5, 8);

    auto payload = decompress(content.substr(HEADER_SIZE), static_cast<size_t>(raw_size));
    if (!payload) {
        return corrupt("decompression failed");
    }
    if (checksum(*payload) != expected_crc) {
        return corrupt("checksum mismatch");
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.hits++;
    return payload;
}

void DirectoryCacheStore::put(const std::string& key, const std::string& bytes) {
    auto fail = [&](const std::string& reason) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.put_failures++;
        return CacheWriteError(key, reason);
    };

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw fail("cannot create " + directory_.string() + ": " + ec.message());
    }

    std::string record(MAGIC, sizeof(MAGIC));
    record.push_back(static_cast<char>(FORMAT_VERSION));
    appendLE(record, checksum(bytes), 4);
    appendLE(record, bytes.size(), 8);
    try {
        record += compress(bytes, compression_level_);
    } catch (const std::runtime_error& e) {
        throw fail(e.what());
    }

    const auto target = pathForKey(key);
    const auto temp = directory_ / ("." + target.filename().string() + ".tmp." +
                                    std::to_string(getpid()) + "." + std::to_string(temp_counter_++));

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw fail("cannot open " + temp.string());
        }
        out.write(record.data(), static_cast<std::streamsize>(record.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(temp, ec);
            throw fail("short write to " + temp.string());
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw fail("cannot rename into place: " + ec.message());
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.puts++;
    stats_.bytes_written += record.size();
}

bool DirectoryCacheStore::remove(const std::string& key) {
    std::error_code ec;
    return std::filesystem::remove(pathForKey(key), ec);
}

CacheStoreStats DirectoryCacheStore::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::optional<std::string> MemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.gets++;

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.misses++;
        return std::nullopt;
    }
    stats_.hits++;
    return it->second;
}

void MemoryCacheStore::put(const std::string& key, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_only_.load()) {
        stats_.put_failures++;
        throw CacheWriteError(key, "store is read-only");
    }
    entries_[key] = bytes;
    stats_.puts++;
    stats_.bytes_written += bytes.size();
}

bool MemoryCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

CacheStoreStats MemoryCacheStore::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace Cache
} // namespace CIP
