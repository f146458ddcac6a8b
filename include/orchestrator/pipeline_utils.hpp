#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "core/pipeline_types.hpp"

namespace CIP {
namespace Orchestrator {

// EN: Formatting and reporting helpers for pipeline results
// FR: Utilitaires de formatage et de rapport pour les résultats de pipeline
namespace PipelineUtils {

    // EN: Time and duration utilities
    // FR: Utilitaires de temps et de durée
    std::string formatDuration(std::chrono::milliseconds duration);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

    // EN: JSON run report
    // FR: Rapport d'exécution JSON
    nlohmann::ordered_json toJson(const StepRecord& record);
    nlohmann::ordered_json toJson(const RunResult& result);
    nlohmann::ordered_json toJson(const PipelineResult& result);
    bool writeReport(const std::string& filepath, const PipelineResult& result);

    // EN: One line per job, for the console
    // FR: Une ligne par job, pour la console
    std::string summarize(const PipelineResult& result);
}

} // namespace Orchestrator
} // namespace CIP
