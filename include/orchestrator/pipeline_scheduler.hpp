#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "core/pipeline_types.hpp"
#include "orchestrator/job_runner.hpp"

namespace CIP {
namespace Orchestrator {

struct SchedulerConfig {
    size_t max_parallel_jobs = 0;                       // EN: 0 = one worker per job / FR: 0 = un worker par job
    std::chrono::milliseconds job_timeout{3600000};     // EN: Used when a job declares none / FR: Utilisé si le job n'en déclare pas
    bool fail_fast = false;
    std::chrono::milliseconds poll_interval{50};
};

using JobCallback = std::function<void(const RunResult& result)>;

// EN: Runs every job of a pipeline concurrently and aggregates the verdict.
//     State machine: Pending -> Running -> {Succeeded, Failed}.
// FR: Exécute tous les jobs d'un pipeline en parallèle et agrège le verdict.
//     Machine à états : Pending -> Running -> {Succeeded, Failed}.
class PipelineScheduler {
public:
    PipelineScheduler(const JobRunner& runner, SchedulerConfig config = SchedulerConfig{});

    PipelineScheduler(const PipelineScheduler&) = delete;
    PipelineScheduler& operator=(const PipelineScheduler&) = delete;

    // EN: Blocks until every selected job is terminal. An empty selection runs all jobs.
    //     Throws std::invalid_argument for unknown job names, before anything runs.
    // FR: Bloque jusqu'à ce que chaque job sélectionné soit terminal. Une sélection vide exécute tous les jobs.
    //     Lance std::invalid_argument pour un nom de job inconnu, avant toute exécution.
    PipelineResult run(const Pipeline& pipeline, const RunContext& run,
                       const std::vector<std::string>& selected_jobs = {});

    // EN: Pipeline-wide cancellation; safe from any thread, before or during run(). It applies to the
    //     current or next run only.
    // FR: Annulation globale du pipeline ; sûre depuis n'importe quel thread, avant ou pendant run(). Elle
    //     ne vaut que pour l'exécution courante ou la suivante.
    void cancel(const std::string& reason = "pipeline cancelled");

    PipelineState state() const { return state_.load(); }

    void setJobCallback(JobCallback callback) { job_callback_ = std::move(callback); }

    static std::vector<const Job*> selectJobs(const Pipeline& pipeline, const std::vector<std::string>& selected_jobs);

    // EN: Succeeded iff every job succeeded or failed with continue-on-error
    // FR: Succeeded ssi chaque job a réussi ou échoué avec continue-on-error
    static PipelineState computeVerdict(const std::vector<RunResult>& results);

private:
    struct JobSlot {
        const Job* job = nullptr;
        std::shared_ptr<CancellationToken> token;
        std::chrono::milliseconds timeout{0};
        std::atomic<bool> started{false};
        std::chrono::steady_clock::time_point started_at;
        bool timed_out = false;
        bool done = false;
    };

    std::shared_ptr<CancellationToken> pipelineToken();
    void onJobFinished(RunResult& result, JobSlot& slot);

    const JobRunner& runner_;
    SchedulerConfig config_;
    JobCallback job_callback_;

    std::atomic<PipelineState> state_{PipelineState::PENDING};
    mutable std::mutex token_mutex_;
    std::shared_ptr<CancellationToken> pipeline_token_;
};

} // namespace Orchestrator
} // namespace CIP
