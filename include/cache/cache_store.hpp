#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/errors.hpp"

namespace CIP {
namespace Cache {

// EN: Statistics for cache store monitoring.
// FR: Statistiques pour le monitoring du stockage de cache.
struct CacheStoreStats {
    size_t gets = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t corrupt_entries = 0;
    size_t puts = 0;
    size_t put_failures = 0;
    size_t bytes_written = 0;
};

// EN: Keyed blob storage. No schema is imposed on the bytes.
// FR: Stockage de blobs par clé. Aucun schéma n'est imposé aux octets.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    // EN: Missing or unreadable entries return std::nullopt
    // FR: Les entrées absentes ou illisibles retournent std::nullopt
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // EN: Throws CacheWriteError. A reader never observes a partially written entry.
    // FR: Lance CacheWriteError. Un lecteur n'observe jamais une entrée partiellement écrite.
    virtual void put(const std::string& key, const std::string& bytes) = 0;

    virtual bool remove(const std::string& key) = 0;
    virtual CacheStoreStats getStats() const = 0;
    virtual std::string description() const = 0;
};

// EN: One file per key under a directory: header (magic, version, crc32, raw size) then a zlib stream.
//     Writes go to a temporary file renamed over the target. A header or checksum mismatch is a miss.
// FR: Un fichier par clé dans un répertoire : en-tête (magic, version, crc32, taille brute) puis un flux zlib.
//     Les écritures passent par un fichier temporaire renommé sur la cible. Un en-tête ou checksum invalide est un miss.
class DirectoryCacheStore : public CacheStore {
public:
    explicit DirectoryCacheStore(const std::string& directory, int compression_level = 6);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& bytes) override;
    bool remove(const std::string& key) override;
    CacheStoreStats getStats() const override;
    std::string description() const override { return "directory:" + directory_.string(); }

    // EN: File holding a key; keys are sanitised, with a checksum suffix when sanitising changed them
    // FR: Fichier contenant une clé ; les clés sont assainies, avec un suffixe checksum si l'assainissement les a modifiées
    std::filesystem::path pathForKey(const std::string& key) const;

    static std::string compress(const std::string& data, int level);
    static std::optional<std::string> decompress(const std::string& data, size_t expected_size);
    static uint32_t checksum(const std::string& data);

private:
    std::filesystem::path directory_;
    int compression_level_;

    mutable std::mutex stats_mutex_;
    CacheStoreStats stats_;
    std::atomic<uint64_t> temp_counter_{0};
};

// EN: Process-local store, used for tests and --dry-run style runs
// FR: Stockage local au processus, utilisé pour les tests et les exécutions de type --dry-run
class MemoryCacheStore : public CacheStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& bytes) override;
    bool remove(const std::string& key) override;
    CacheStoreStats getStats() const override;
    std::string description() const override { return "memory"; }

    size_t size() const;

    // EN: Reject every put, to exercise write failure paths
    // FR: Rejette chaque put, pour exercer les chemins d'échec d'écriture
    void setReadOnly(bool read_only) { read_only_ = read_only; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
    CacheStoreStats stats_;
    std::atomic<bool> read_only_{false};
};

} // namespace Cache
} // namespace CIP
