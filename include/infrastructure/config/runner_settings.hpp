#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace CIP {

// EN: Typed view of the runner configuration sections (scheduler, workspace, cache, toolchain, executor, logging).
// FR: Vue typée des sections de configuration du runner (scheduler, workspace, cache, toolchain, executor, logging).
struct RunnerSettings {
    // scheduler
    size_t max_parallel_jobs = 0;                           // EN: 0 = one worker per job / FR: 0 = un worker par job
    std::chrono::seconds job_timeout{3600};
    std::chrono::milliseconds grace_period{5000};           // EN: SIGTERM -> SIGKILL delay / FR: Délai SIGTERM -> SIGKILL
    bool fail_fast = false;                                 // EN: Cancel running jobs on first failure / FR: Annule les jobs en cours au premier échec

    // workspace
    std::string workspace_root;                             // EN: Empty = system temp directory / FR: Vide = répertoire temporaire système
    bool keep_workspace = false;

    // cache
    std::string cache_directory = ".cip-cache";
    bool cache_enabled = true;
    int compression_level = 6;
    std::vector<std::string> cache_default_paths;           // EN: Cached when a job declares nothing / FR: Mis en cache si un job ne déclare rien

    // toolchain
    std::string toolchain_root;
    std::string toolchain_install_command;
    bool toolchain_allow_host = true;

    // executor
    std::string default_shell = "sh";

    // logging
    std::string log_level = "INFO";
    std::string log_file;

    // EN: Read settings from a config manager, keeping defaults for missing keys.
    // FR: Lit les paramètres depuis un gestionnaire de configuration, en gardant les défauts pour les clés absentes.
    static RunnerSettings fromConfig(const ConfigManager& config);

    // EN: Validation rules for every recognised key.
    // FR: Règles de validation pour chaque clé reconnue.
    static std::vector<ConfigManager::ValidationRule> validationRules();
};

} // namespace CIP
