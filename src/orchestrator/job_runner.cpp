#include "orchestrator/job_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <memory>
#include <unordered_map>

namespace CIP {
namespace Orchestrator {

namespace {

std::unordered_map<std::string, std::string> jobMetadata(const Job& job) {
    return {{"job", job.id}};
}

void markCancelled(RunResult& result, const std::string& reason) {
    result.status = JobStatus::CANCELLED;
    result.error_kind = "Cancelled";
    result.error_message = reason;
}

} // namespace

JobRunner::JobRunner(const Execution::StepExecutor& executor, Cache::CacheGate* cache_gate, JobRunnerConfig config)
    : executor_(executor), cache_gate_(cache_gate), config_(std::move(config)) {}

void JobRunner::seedEnvironment(Execution::JobEnvironment& environment, const Pipeline& pipeline, const Job& job,
                                const RunContext& run) const {
    environment.setVariable("CI", "true");
    environment.setVariable("CIP", "true");
    environment.setVariable("CIP_JOB", job.id);
    environment.setVariable("CIP_RUN_ID", run.run_id);
    environment.setVariable("CIP_REF", run.event.ref);
    environment.setVariable("CIP_SHA", run.event.commit);
    environment.setVariable("CIP_EVENT", toString(run.event.kind));
    environment.setVariable("CIP_OS", job.runs_on.empty() ? "local" : job.runs_on);

    // EN: Pipeline variables first, then job variables; each may reference earlier ones
    // FR: Variables du pipeline d'abord, puis du job ; chacune peut référencer les précédentes
    for (const Parameters* layer : {&pipeline.env, &job.env}) {
        for (const auto& [name, value] : *layer) {
            environment.setVariable(name, Execution::StepExecutor::expandExpressions(value, environment));
        }
    }
}

RunResult JobRunner::run(const Pipeline& pipeline, const Job& job, const RunContext& run,
                         const CancellationToken* token) const {
    RunResult result;
    result.job_id = job.id;
    result.continue_on_error = job.continue_on_error;
    result.start_time = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    if (token && token->isCancelled()) {
        markCancelled(result, token->reason());
        LOG_INFO_META("job", "Job " + job.id + " cancelled before start: " + result.error_message, jobMetadata(job));
        finish(result, started);
        return result;
    }

    LOG_INFO_META("job", "Starting job " + job.id + " (" + job.displayName() + ")", jobMetadata(job));

    std::unique_ptr<Execution::JobEnvironment> environment;
    try {
        environment = std::make_unique<Execution::JobEnvironment>(job.id, config_.workspace_root,
                                                                  config_.keep_workspace);
    } catch (const EnvironmentProvisionError& e) {
        result.status = JobStatus::FAILURE;
        result.error_kind = e.kind();
        result.error_message = e.what();
        LOG_ERROR_META("job", "Job " + job.id + " could not be provisioned: " + e.what(), jobMetadata(job));
        finish(result, started);
        return result;
    }

    seedEnvironment(*environment, pipeline, job, run);

    if (cache_gate_) {
        result.cache_restored = cache_gate_->restore(job, run, *environment).has_value();
    }

    for (size_t index = 0; index < job.steps.size(); ++index) {
        const Step& step = job.steps[index];
        const auto step_started = std::chrono::steady_clock::now();

        try {
            StepRecord record = executor_.execute(step, index, *environment, run, token);
            notifyStep(job.id, record);
            result.steps.push_back(std::move(record));
            continue;
        } catch (const CancelledError& e) {
            markCancelled(result, e.reason());
            LOG_WARN_META("job", "Job " + job.id + " cancelled during step " + std::to_string(index) + ": " +
                          e.reason(), jobMetadata(job));
            finish(result, started);
            return result;
        } catch (const StepFailure& e) {
            StepRecord record;
            record.index = index;
            record.name = step.displayName();
            record.exit_code = e.exitCode();
            record.stdout_data = e.stdoutData();
            record.stderr_data = e.stderrData();
            record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - step_started);
            notifyStep(job.id, record);
            result.steps.push_back(std::move(record));

            result.exit_code = e.exitCode();
            result.error_kind = e.kind();
            result.error_message = e.what();
        } catch (const UnknownActionError& e) {
            StepRecord record;
            record.index = index;
            record.name = step.displayName();
            record.exit_code = 1;
            record.stderr_data = std::string(e.what()) + "\n";
            notifyStep(job.id, record);
            result.steps.push_back(std::move(record));

            result.exit_code = 1;
            result.error_kind = e.kind();
            result.error_message = e.what();
        } catch (const std::exception& e) {
            // EN: Spawn failures and filesystem errors fail the step like a non-zero exit
            // FR: Les échecs de lancement et erreurs de fichiers font échouer l'étape comme un code non nul
            StepRecord record;
            record.index = index;
            record.name = step.displayName();
            record.exit_code = 1;
            record.stderr_data = std::string(e.what()) + "\n";
            notifyStep(job.id, record);
            result.steps.push_back(std::move(record));

            result.exit_code = 1;
            result.error_kind = "StepFailure";
            result.error_message = e.what();
        }

        result.status = JobStatus::FAILURE;
        result.failing_step = index;
        LOG_ERROR_META("job", "Job " + job.id + " failed at step " + std::to_string(index) + ": " +
                       result.error_message, jobMetadata(job));
        finish(result, started);
        return result;
    }

    if (token && token->isCancelled()) {
        markCancelled(result, token->reason());
        LOG_WARN_META("job", "Job " + job.id + " cancelled after its last step: " + result.error_message,
                      jobMetadata(job));
        finish(result, started);
        return result;
    }

    result.status = JobStatus::SUCCESS;
    result.exit_code = 0;

    if (cache_gate_ && cache_gate_->isEnabled()) {
        result.cache_save_attempted = true;
        result.cache_saved = cache_gate_->save(job, run, *environment);
    }

    LOG_INFO_META("job", "Job " + job.id + " succeeded", jobMetadata(job));
    finish(result, started);
    return result;
}

void JobRunner::finish(RunResult& result, std::chrono::steady_clock::time_point started) const {
    result.end_time = std::chrono::system_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

void JobRunner::notifyStep(const std::string& job_id, const StepRecord& record) const {
    if (!step_callback_) {
        return;
    }
    try {
        step_callback_(job_id, record);
    } catch (const std::exception& e) {
        LOG_WARN("job", "Step callback failed: " + std::string(e.what()));
    }
}

} // namespace Orchestrator
} // namespace CIP
