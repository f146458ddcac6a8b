#pragma once

#include <functional>
#include <string>

#include "cache/cache_gate.hpp"
#include "core/cancellation.hpp"
#include "core/pipeline_types.hpp"
#include "execution/step_executor.hpp"

namespace CIP {
namespace Orchestrator {

struct JobRunnerConfig {
    std::string workspace_root;         // EN: Empty = system temp directory / FR: Vide = répertoire temporaire système
    bool keep_workspace = false;
};

// EN: Called after each executed step, including the failing one
// FR: Appelé après chaque étape exécutée, y compris celle en échec
using StepCallback = std::function<void(const std::string& job_id, const StepRecord& record)>;

// EN: Executes one job: fresh environment, cache restore, steps in order with fail-fast, cache save on success.
//     Never throws; every outcome is reported in the RunResult.
// FR: Exécute un job : environnement neuf, restauration du cache, étapes dans l'ordre avec fail-fast,
//     sauvegarde du cache en cas de succès. Ne lance jamais ; chaque issue est rapportée dans le RunResult.
class JobRunner {
public:
    // EN: cache_gate may be null to run without caching
    // FR: cache_gate peut être nul pour exécuter sans cache
    JobRunner(const Execution::StepExecutor& executor, Cache::CacheGate* cache_gate,
              JobRunnerConfig config = JobRunnerConfig{});

    RunResult run(const Pipeline& pipeline, const Job& job, const RunContext& run,
                  const CancellationToken* token = nullptr) const;

    void setStepCallback(StepCallback callback) { step_callback_ = std::move(callback); }

private:
    void seedEnvironment(Execution::JobEnvironment& environment, const Pipeline& pipeline, const Job& job,
                         const RunContext& run) const;
    void finish(RunResult& result, std::chrono::steady_clock::time_point started) const;
    void notifyStep(const std::string& job_id, const StepRecord& record) const;

    const Execution::StepExecutor& executor_;
    Cache::CacheGate* cache_gate_;
    JobRunnerConfig config_;
    StepCallback step_callback_;
};

} // namespace Orchestrator
} // namespace CIP
