#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cache/cache_store.hpp"
#include "core/pipeline_types.hpp"
#include "execution/action_registry.hpp"
#include "execution/job_environment.hpp"

namespace CIP {
namespace Cache {

// EN: Restored or saved cache content for one job
// FR: Contenu de cache restauré ou sauvegardé pour un job
struct CacheEntry {
    std::string key;
    std::string blob;
    std::vector<std::string> paths;
};

// EN: Statistics for cache gate monitoring. Every attempt is counted, including failures.
// FR: Statistiques pour le monitoring du cache gate. Chaque tentative est comptée, échecs inclus.
struct CacheGateStats {
    size_t restore_attempts = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t corrupt_entries = 0;
    size_t save_attempts = 0;
    size_t saves = 0;
    size_t save_failures = 0;
    std::vector<std::string> saved_keys;
};

struct CacheGateOptions {
    bool enabled = true;
    std::vector<std::string> default_paths;     // EN: Used when a job declares no cache / FR: Utilisés si un job ne déclare aucun cache
    std::string default_key = "{job}-{os}";
};

// EN: Computes a deterministic key per job, restores prior contents before the steps run and
//     persists them after a successful job. Misses and corrupt entries are never errors;
//     save failures are logged and reported as false.
// FR: Calcule une clé déterministe par job, restaure le contenu précédent avant les étapes et
//     le persiste après un job réussi. Les miss et entrées corrompues ne sont jamais des erreurs ;
//     les échecs de sauvegarde sont loggés et rapportés par false.
class CacheGate {
public:
    CacheGate(std::shared_ptr<CacheStore> store, const Execution::ActionRegistry& registry,
              CacheGateOptions options = CacheGateOptions{});

    // EN: Declared cache, else the first cache action step, else the configured defaults
    // FR: Cache déclaré, sinon la première étape d'action de cache, sinon les défauts configurés
    CacheSpec effectiveSpec(const Job& job) const;

    // EN: Placeholders {job}, {os}, {ref}, {hash:<path>}; ${{ runner.os }} and ${{ hashFiles('<path>') }}
    //     are accepted as aliases. The job id is always part of the key.
    // FR: Marqueurs {job}, {os}, {ref}, {hash:<chemin>} ; ${{ runner.os }} et ${{ hashFiles('<chemin>') }}
    //     sont acceptés comme alias. L'identifiant du job fait toujours partie de la clé.
    std::string computeKey(const Job& job, const CacheSpec& spec, const RunContext& run) const;

    // EN: Fingerprint of a file or directory below the source tree: crc32 and byte count, in hex
    // FR: Empreinte d'un fichier ou répertoire de l'arbre source : crc32 et nombre d'octets, en hexa
    static std::string fingerprint(const std::string& source_directory, const std::string& relative_path);

    std::optional<CacheEntry> restore(const Job& job, const RunContext& run, Execution::JobEnvironment& environment);
    bool save(const Job& job, const RunContext& run, const Execution::JobEnvironment& environment);

    CacheGateStats getStats() const;
    bool isEnabled() const { return options_.enabled; }

private:
    std::shared_ptr<CacheStore> store_;
    const Execution::ActionRegistry& registry_;
    CacheGateOptions options_;

    mutable std::mutex stats_mutex_;
    CacheGateStats stats_;
};

} // namespace Cache
} // namespace CIP
