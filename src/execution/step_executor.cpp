#include "execution/step_executor.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <regex>
#include <unordered_map>

namespace CIP {
namespace Execution {

namespace {

const std::regex ENV_EXPRESSION(R"(\$\{\{\s*env\.([A-Za-z_][A-Za-z0-9_]*)\s*\}\})");

std::unordered_map<std::string, std::string> stepMetadata(const JobEnvironment& environment, size_t index) {
    return {{"job", environment.jobId()}, {"step", std::to_string(index)}};
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

StepExecutor::StepExecutor(const ActionRegistry& registry, const ProcessRunner& runner, std::string default_shell)
    : registry_(registry), runner_(runner), default_shell_(std::move(default_shell)) {}

std::string StepExecutor::expandExpressions(const std::string& text, const JobEnvironment& environment) {
    if (text.find("${{") == std::string::npos) {
        return text;
    }

    std::string result;
    auto begin = std::sregex_iterator(text.begin(), text.end(), ENV_EXPRESSION);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(text, last, static_cast<size_t>(match.position(0)) - last);
        result += environment.getVariable(match[1].str()).value_or("");
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    result.append(text, last, std::string::npos);
    return result;
}

StepRecord StepExecutor::execute(const Step& step, size_t index, JobEnvironment& environment,
                                 const RunContext& run, const CancellationToken* token) const {
    if (token && token->isCancelled()) {
        throw CancelledError(token->reason());
    }

    LOG_INFO_META("step", "Starting step " + std::to_string(index) + ": " + step.displayName(),
                  stepMetadata(environment, index));

    StepRecord record = step.isAction()
        ? executeAction(step, index, environment, run, token)
        : executeCommand(step, index, environment, token);

    LOG_INFO_META("step", "Step " + std::to_string(index) + " succeeded in " +
                  std::to_string(record.duration.count()) + "ms",
                  stepMetadata(environment, index));
    return record;
}

StepRecord StepExecutor::executeAction(const Step& step, size_t index, JobEnvironment& environment,
                                       const RunContext& run, const CancellationToken* token) const {
    auto started = std::chrono::steady_clock::now();

    ActionHandler& handler = registry_.resolve(*step.uses);

    Parameters inputs;
    inputs.reserve(step.with.size());
    for (const auto& [key, value] : step.with) {
        inputs.emplace_back(key, expandExpressions(value, environment));
    }

    ActionContext context{step, inputs, environment, run, runner_, token};
    ActionOutcome outcome;
    try {
        outcome = handler.execute(context);
    } catch (const std::filesystem::filesystem_error& e) {
        outcome = ActionOutcome::failure(handler.description() + ": " + e.what());
    }

    if (!outcome.success) {
        LOG_WARN_META("step", "Action " + step.uses->toString() + " failed: " + outcome.message,
                      stepMetadata(environment, index));
        throw StepFailure(outcome.message, outcome.exit_code == 0 ? 1 : outcome.exit_code,
                          outcome.stdout_data, outcome.stderr_data);
    }

    StepRecord record;
    record.index = index;
    record.name = step.displayName();
    record.exit_code = 0;
    record.stdout_data = std::move(outcome.stdout_data);
    record.stderr_data = std::move(outcome.stderr_data);
    record.duration = elapsedSince(started);
    return record;
}

StepRecord StepExecutor::executeCommand(const Step& step, size_t index, JobEnvironment& environment,
                                        const CancellationToken* token) const {
    std::filesystem::path working_directory;
    try {
        working_directory = environment.resolvePath(expandExpressions(step.working_directory, environment));
    } catch (const std::invalid_argument& e) {
        throw StepFailure(e.what(), 1, "", std::string(e.what()) + "\n");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(working_directory, ec)) {
        std::string message = "Working directory does not exist: " + working_directory.string();
        throw StepFailure(message, 1, "", message + "\n");
    }

    // EN: Step overrides are expanded against the job variables, then win over them
    // FR: Les surcharges d'étape sont expansées avec les variables du job, puis l'emportent sur elles
    Parameters overrides;
    overrides.reserve(step.env.size());
    for (const auto& [name, value] : step.env) {
        overrides.emplace_back(name, expandExpressions(value, environment));
    }

    ProcessRequest request;
    request.command = expandExpressions(*step.run, environment);
    request.shell = step.shell.empty() ? default_shell_ : step.shell;
    request.working_directory = working_directory.string();
    request.environment = environment.environmentBlock(overrides);

    ProcessResult result = runner_.run(request, token);

    if (result.cancelled) {
        throw CancelledError(token ? token->reason() : "step interrupted");
    }

    if (result.exit_code != 0) {
        LOG_WARN_META("step", "Command exited with code " + std::to_string(result.exit_code),
                      stepMetadata(environment, index));
        throw StepFailure("Step " + std::to_string(index) + " (" + step.displayName() + ") exited with code " +
                              std::to_string(result.exit_code),
                          result.exit_code, std::move(result.stdout_data), std::move(result.stderr_data));
    }

    StepRecord record;
    record.index = index;
    record.name = step.displayName();
    record.exit_code = result.exit_code;
    record.stdout_data = std::move(result.stdout_data);
    record.stderr_data = std::move(result.stderr_data);
    record.duration = result.duration;
    return record;
}

} // namespace Execution
} // namespace CIP
