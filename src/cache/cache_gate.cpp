#include "cache/cache_gate.hpp"
#include "cache/cache_archive.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace CIP {
namespace Cache {

namespace {

const std::regex RUNNER_OS_ALIAS(R"(\$\{\{\s*runner\.os\s*\}\})");
const std::regex HASH_FILES_ALIAS(R"(\$\{\{\s*hashFiles\(\s*'([^']*)'\s*\)\s*\}\})");
const std::regex PLACEHOLDER(R"(\{(job|os|ref|hash:[^}]*)\})");

std::string toHex(uint64_t value, int width) {
    std::ostringstream oss;
    oss << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

uLong crcUpdate(uLong crc, const std::string& data) {
    return crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

CacheGate::CacheGate(std::shared_ptr<CacheStore> store, const Execution::ActionRegistry& registry,
                     CacheGateOptions options)
    : store_(std::move(store)), registry_(registry), options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("CacheGate requires a cache store");
    }
}

CacheSpec CacheGate::effectiveSpec(const Job& job) const {
    if (job.cache) {
        CacheSpec spec = *job.cache;
        if (spec.key.empty()) {
            spec.key = options_.default_key;
        }
        return spec;
    }

    for (const auto& step : job.steps) {
        if (!step.isAction()) {
            continue;
        }
        Execution::ActionHandler* handler = registry_.find(*step.uses);
        if (!handler) {
            continue;
        }
        if (auto spec = handler->cacheSpec(step)) {
            return *spec;
        }
    }

    return CacheSpec{options_.default_key, options_.default_paths};
}

std::string CacheGate::fingerprint(const std::string& source_directory, const std::string& relative_path) {
    if (source_directory.empty()) {
        return "none";
    }

    const fs::path root = fs::path(source_directory);
    const fs::path target = (root / relative_path).lexically_normal();
    std::error_code ec;

    if (fs::is_regular_file(target, ec)) {
        const std::string content = readFile(target);
        return toHex(crcUpdate(crc32(0L, Z_NULL, 0), content), 8) + "-" + toHex(content.size(), 1);
    }

    if (fs::is_directory(target, ec)) {
        std::vector<fs::path> files;
        for (auto it = fs::recursive_directory_iterator(target, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                files.push_back(it->path());
            }
        }
        std::sort(files.begin(), files.end());

        uLong crc = crc32(0L, Z_NULL, 0);
        uint64_t total = 0;
        for (const auto& file : files) {
            const std::string content = readFile(file);
            crc = crcUpdate(crc, file.lexically_relative(target).generic_string());
            crc = crcUpdate(crc, content);
            total += content.size();
        }
        return toHex(crc, 8) + "-" + toHex(total, 1);
    }

    return "none";
}

std::string CacheGate::computeKey(const Job& job, const CacheSpec& spec, const RunContext& run) const {
    std::string key_template = spec.key.empty() ? options_.default_key : spec.key;
    key_template = std::regex_replace(key_template, RUNNER_OS_ALIAS, "{os}");
    key_template = std::regex_replace(key_template, HASH_FILES_ALIAS, "{hash:$1}");

    std::string key;
    size_t last = 0;
    for (auto it = std::sregex_iterator(key_template.begin(), key_template.end(), PLACEHOLDER);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        key.append(key_template, last, static_cast<size_t>(match.position(0)) - last);

        const std::string name = match[1].str();
        if (name == "job") {
            key += job.id;
        } else if (name == "os") {
            key += job.runs_on.empty() ? "local" : job.runs_on;
        } else if (name == "ref") {
            key += run.event.ref.empty() ? "none" : run.event.ref;
        } else {
            key += fingerprint(run.source_directory, name.substr(5));
        }
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    key.append(key_template, last, std::string::npos);

    // EN: Keys are namespaced per job so concurrent jobs never share an entry
    // FR: Les clés sont cloisonnées par job pour que des jobs concurrents ne partagent jamais une entrée
    if (key_template.find("{job}") == std::string::npos) {
        key = job.id + "-" + key;
    }
    return key;
}

std::optional<CacheEntry> CacheGate::restore(const Job& job, const RunContext& run,
                                             Execution::JobEnvironment& environment) {
    if (!options_.enabled) {
        return std::nullopt;
    }

    const CacheSpec spec = effectiveSpec(job);
    const std::string key = computeKey(job, spec, run);
    environment.setVariable("CIP_CACHE_KEY", key);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.restore_attempts++;
    }

    std::optional<std::string> blob;
    try {
        blob = store_->get(key);
    } catch (const std::exception& e) {
        LOG_WARN("cache_gate", "Cache lookup failed for " + key + ": " + e.what());
    }

    if (!blob) {
        LOG_INFO("cache_gate", "Cache miss for job " + job.id + " (key " + key + ")");
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.misses++;
        return std::nullopt;
    }

    try {
        ArchiveSummary summary = CacheArchive::unpack(*blob, environment.workspace());
        LOG_INFO("cache_gate", "Cache hit for job " + job.id + " (key " + key + "): " +
                 std::to_string(summary.files) + " files restored");
    } catch (const std::exception& e) {
        LOG_WARN("cache_gate", "Discarding unreadable cache entry " + key + ": " + e.what());

        // EN: Drop whatever a partial unpack left behind so the job starts from a clean state
        // FR: Supprime ce qu'un décompactage partiel a laissé pour que le job reparte d'un état propre
        for (const auto& path : spec.paths) {
            const fs::path relative = fs::path(path).lexically_normal();
            if (!CacheArchive::isSafeRelative(relative)) {
                LOG_WARN("cache_gate", "Not cleaning cache path outside the workspace: " + path);
                continue;
            }
            std::error_code ec;
            fs::remove_all(environment.workspace() / relative, ec);
        }

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.corrupt_entries++;
        stats_.misses++;
        return std::nullopt;
    }

    environment.setCacheHit(true);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.hits++;
    }
    return CacheEntry{key, std::move(*blob), spec.paths};
}

bool CacheGate::save(const Job& job, const RunContext& run, const Execution::JobEnvironment& environment) {
    if (!options_.enabled) {
        return false;
    }

    const CacheSpec spec = effectiveSpec(job);
    const std::string key = computeKey(job, spec, run);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.save_attempts++;
    }

    try {
        ArchiveSummary summary;
        std::string blob = CacheArchive::pack(environment.workspace(), spec.paths, &summary);
        store_->put(key, blob);

        LOG_INFO("cache_gate", "Saved cache for job " + job.id + " (key " + key + "): " +
                 std::to_string(summary.files) + " files, " + std::to_string(summary.bytes) + " bytes");

        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.saves++;
        stats_.saved_keys.push_back(key);
        return true;
    } catch (const CacheWriteError& e) {
        LOG_WARN("cache_gate", e.what());
    } catch (const std::exception& e) {
        LOG_WARN("cache_gate", CacheWriteError(key, e.what()).what());
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.save_failures++;
    return false;
}

CacheGateStats CacheGate::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace Cache
} // namespace CIP
