#include "orchestrator/pipeline_scheduler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace CIP {
namespace Orchestrator {

PipelineScheduler::PipelineScheduler(const JobRunner& runner, SchedulerConfig config)
    : runner_(runner), config_(std::move(config)), pipeline_token_(std::make_shared<CancellationToken>()) {}

std::shared_ptr<CancellationToken> PipelineScheduler::pipelineToken() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    return pipeline_token_;
}

void PipelineScheduler::cancel(const std::string& reason) {
    LOG_WARN("scheduler", "Cancelling pipeline: " + reason);
    pipelineToken()->cancel(reason);
}

std::vector<const Job*> PipelineScheduler::selectJobs(const Pipeline& pipeline,
                                                      const std::vector<std::string>& selected_jobs) {
    std::vector<const Job*> jobs;
    if (selected_jobs.empty()) {
        for (const auto& job : pipeline.jobs) {
            jobs.push_back(&job);
        }
        return jobs;
    }

    for (const auto& name : selected_jobs) {
        if (!pipeline.findJob(name)) {
            throw std::invalid_argument("Unknown job '" + name + "' in pipeline '" + pipeline.name + "'");
        }
    }

    // EN: Keep declaration order whatever the selection order
    // FR: Conserve l'ordre de déclaration quel que soit l'ordre de sélection
    std::unordered_set<std::string> wanted(selected_jobs.begin(), selected_jobs.end());
    for (const auto& job : pipeline.jobs) {
        if (wanted.count(job.id)) {
            jobs.push_back(&job);
        }
    }
    return jobs;
}

PipelineState PipelineScheduler::computeVerdict(const std::vector<RunResult>& results) {
    for (const auto& result : results) {
        if (result.isSuccess()) {
            continue;
        }
        if (result.isFailure() && result.continue_on_error) {
            continue;
        }
        return PipelineState::FAILED;
    }
    return PipelineState::SUCCEEDED;
}

void PipelineScheduler::onJobFinished(RunResult& result, JobSlot& slot) {
    slot.done = true;

    if (slot.timed_out && !result.isCancelled()) {
        result.status = JobStatus::CANCELLED;
        result.error_kind = "Cancelled";
        result.error_message = "job exceeded timeout of " + std::to_string(slot.timeout.count()) + "ms";
    }

    if (!result.isSuccess() && !(result.isFailure() && result.continue_on_error)) {
        PipelineState expected = PipelineState::RUNNING;
        if (state_.compare_exchange_strong(expected, PipelineState::FAILED)) {
            LOG_WARN("scheduler", "Pipeline failed: job " + result.job_id + " reported " + toString(result.status));
        }
        if (config_.fail_fast && result.isFailure()) {
            pipelineToken()->cancel("fail-fast: job " + result.job_id + " failed");
        }
    }

    if (job_callback_) {
        try {
            job_callback_(result);
        } catch (const std::exception& e) {
            LOG_WARN("scheduler", "Job callback failed: " + std::string(e.what()));
        }
    }
}

PipelineResult PipelineScheduler::run(const Pipeline& pipeline, const RunContext& run,
                                      const std::vector<std::string>& selected_jobs) {
    const std::vector<const Job*> jobs = selectJobs(pipeline, selected_jobs);

    PipelineResult result;
    result.run_id = run.run_id;
    result.pipeline_name = pipeline.name;
    result.event = run.event;
    result.start_time = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    state_ = PipelineState::RUNNING;
    LOG_INFO("scheduler", "Running pipeline '" + pipeline.name + "' with " + std::to_string(jobs.size()) +
             " job(s) for " + toString(run.event.kind) + " " + run.event.ref);

    std::vector<std::unique_ptr<JobSlot>> slots;
    std::vector<std::future<RunResult>> futures;
    std::vector<RunResult> results(jobs.size());

    if (!jobs.empty()) {
        const auto token = pipelineToken();

        ThreadPoolConfig pool_config;
        pool_config.threads = config_.max_parallel_jobs > 0 ? std::min(config_.max_parallel_jobs, jobs.size())
                                                            : jobs.size();
        pool_config.max_queue_size = 0;
        ThreadPool pool(pool_config);

        for (const Job* job : jobs) {
            auto slot = std::make_unique<JobSlot>();
            slot->job = job;
            slot->token = std::make_shared<CancellationToken>(token);
            slot->timeout = job->timeout ? std::chrono::duration_cast<std::chrono::milliseconds>(*job->timeout)
                                         : config_.job_timeout;

            JobSlot* raw = slot.get();
            futures.push_back(pool.submitNamed(job->id, [this, raw, &pipeline, &run]() {
                raw->started_at = std::chrono::steady_clock::now();
                raw->started = true;
                return runner_.run(pipeline, *raw->job, run, raw->token.get());
            }));
            slots.push_back(std::move(slot));
        }

        // EN: Watchdog loop: collect finished jobs as they complete and enforce per-job timeouts
        // FR: Boucle de surveillance : collecte les jobs terminés et applique les timeouts par job
        size_t remaining = jobs.size();
        while (remaining > 0) {
            for (size_t i = 0; i < slots.size(); ++i) {
                JobSlot& slot = *slots[i];
                if (slot.done) {
                    continue;
                }

                if (futures[i].wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                    try {
                        results[i] = futures[i].get();
                    } catch (const std::exception& e) {
                        results[i].job_id = slot.job->id;
                        results[i].status = JobStatus::FAILURE;
                        results[i].error_kind = "InternalError";
                        results[i].error_message = e.what();
                        results[i].continue_on_error = slot.job->continue_on_error;
                    }
                    onJobFinished(results[i], slot);
                    remaining--;
                    continue;
                }

                if (!slot.timed_out && slot.started &&
                    std::chrono::steady_clock::now() - slot.started_at >= slot.timeout) {
                    slot.timed_out = true;
                    LOG_WARN("scheduler", "Job " + slot.job->id + " exceeded its timeout of " +
                             std::to_string(slot.timeout.count()) + "ms");
                    slot.token->cancel("timeout after " + std::to_string(slot.timeout.count()) + "ms");
                }
            }

            if (remaining > 0) {
                std::this_thread::sleep_for(config_.poll_interval);
            }
        }

        pool.shutdown();
    }

    // EN: A cancellation is consumed by the run it stopped; the next run starts with a fresh token
    // FR: Une annulation est consommée par l'exécution qu'elle a arrêtée ; la suivante repart d'un jeton neuf
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        pipeline_token_ = std::make_shared<CancellationToken>();
    }

    result.jobs = std::move(results);
    result.verdict = computeVerdict(result.jobs);
    state_ = result.verdict;

    result.end_time = std::chrono::system_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    LOG_INFO("scheduler", "Pipeline '" + pipeline.name + "' finished: " + toString(result.verdict));
    return result;
}

} // namespace Orchestrator
} // namespace CIP
