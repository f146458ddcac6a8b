#include "infrastructure/cli/application.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

#include "cache/cache_gate.hpp"
#include "cache/cache_store.hpp"
#include "core/errors.hpp"
#include "declaration/declaration_parser.hpp"
#include "execution/builtin_actions.hpp"
#include "execution/process_runner.hpp"
#include "execution/step_executor.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/job_runner.hpp"
#include "orchestrator/pipeline_scheduler.hpp"
#include "orchestrator/pipeline_utils.hpp"

namespace CIP {
namespace CLI {

int Application::run(int argc, char* argv[]) {
    CommandLineParser parser;
    parser.addStandardOptions();
    return execute(parser.parse(argc, argv));
}

int Application::run(const std::vector<std::string>& arguments) {
    CommandLineParser parser;
    parser.addStandardOptions();
    return execute(parser.parse(arguments));
}

int Application::execute(const CliParseResult& cli) {
    if (cli.status == CliParseStatus::HELP_REQUESTED) {
        out_ << cli.help_text;
        return EXIT_OK;
    }
    if (cli.status == CliParseStatus::VERSION_REQUESTED) {
        out_ << cli.version_text << std::endl;
        return EXIT_OK;
    }
    if (!cli.ok()) {
        for (const auto& error : cli.errors) {
            err_ << "cipctl: " << error << std::endl;
        }
        err_ << "Try 'cipctl --help' for more information." << std::endl;
        return EXIT_USAGE;
    }

    RunnerSettings settings;
    if (!loadSettings(cli, settings) || !setupLogging(settings)) {
        return EXIT_USAGE;
    }

    Pipeline pipeline;
    try {
        pipeline = Declaration::DeclarationParser::parseFile(cli.declaration_file);
    } catch (const DeclarationError& e) {
        err_ << "cipctl: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    try {
        switch (cli.command) {
            case CliCommand::VALIDATE:
                out_ << Declaration::DeclarationParser::serialize(pipeline);
                return EXIT_OK;
            case CliCommand::LIST:
                return listJobs(pipeline);
            case CliCommand::RUN:
                return runPipeline(cli, pipeline, settings);
            default:
                return EXIT_USAGE;
        }
    } catch (const std::invalid_argument& e) {
        err_ << "cipctl: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        LOG_ERROR("cipctl", std::string("Run aborted: ") + e.what());
        err_ << "cipctl: " << e.what() << std::endl;
        return EXIT_PIPELINE_FAILED;
    }
}

// EN: Loads the runner configuration: file, then CIP_* environment, then command line
// FR: Charge la configuration du runner : fichier, puis environnement CIP_*, puis ligne de commande
bool Application::loadSettings(const CliParseResult& cli, RunnerSettings& settings) {
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();
    config.addValidationRules(RunnerSettings::validationRules());

    if (cli.has("config") && !config.loadFromFile(cli.get("config"))) {
        err_ << "cipctl: cannot load configuration " << cli.get("config") << std::endl;
        return false;
    }
    config.loadEnvironmentOverrides("CIP_");
    CommandLineParser::applyOverrides(cli, config);

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            err_ << "cipctl: " << error << std::endl;
        }
        return false;
    }

    settings = RunnerSettings::fromConfig(config);
    return true;
}

bool Application::setupLogging(const RunnerSettings& settings) {
    Logger& logger = Logger::getInstance();
    try {
        logger.setLogLevel(parseLogLevel(settings.log_level));
    } catch (const std::invalid_argument& e) {
        err_ << "cipctl: " << e.what() << std::endl;
        return false;
    }
    if (!settings.log_file.empty() && !logger.setOutputFile(settings.log_file)) {
        err_ << "cipctl: cannot open log file " << settings.log_file << std::endl;
        return false;
    }
    return true;
}

int Application::listJobs(const Pipeline& pipeline) {
    for (const auto& job : pipeline.jobs) {
        out_ << job.id;
        if (!job.name.empty() && job.name != job.id) {
            out_ << "\t" << job.name;
        }
        out_ << "\n";
    }
    return EXIT_OK;
}

void Application::printPlan(const Pipeline& pipeline, const std::vector<const Job*>& jobs,
                            const Cache::CacheGate& gate, const RunContext& run) {
    out_ << "Pipeline '" << pipeline.name << "' (" << jobs.size() << " job(s), dry run)\n";
    for (const Job* job : jobs) {
        const CacheSpec spec = gate.effectiveSpec(*job);
        out_ << "  " << job->id << " [" << (job->runs_on.empty() ? "local" : job->runs_on) << "]";
        if (job->continue_on_error) {
            out_ << " continue-on-error";
        }
        out_ << "\n";
        if (gate.isEnabled()) {
            out_ << "    cache " << gate.computeKey(*job, spec, run);
            for (const auto& path : spec.paths) {
                out_ << " " << path;
            }
            out_ << "\n";
        }
        for (size_t i = 0; i < job->steps.size(); ++i) {
            const Step& step = job->steps[i];
            out_ << "    " << i << ". " << step.displayName();
            if (step.isAction()) {
                out_ << " (uses " << step.uses->toString() << ")";
            }
            out_ << "\n";
        }
    }
}

int Application::runPipeline(const CliParseResult& cli, const Pipeline& pipeline, const RunnerSettings& settings) {
    Logger& logger = Logger::getInstance();

    RunContext run;
    run.run_id = logger.generateCorrelationId();
    run.event.kind = parseEventKind(cli.get("event", "push"));
    run.event.ref = cli.get("ref", "refs/heads/master");
    run.event.commit = cli.get("sha");
    run.source_directory = std::filesystem::absolute(cli.get("source", ".")).string();
    logger.setCorrelationId(run.run_id);

    if (!pipeline.acceptsEvent(run.event.kind)) {
        err_ << "cipctl: pipeline '" << pipeline.name << "' is not triggered by "
             << toString(run.event.kind) << " events" << std::endl;
        return EXIT_OK;
    }

    Execution::ActionRegistry registry;
    Execution::ToolchainOptions toolchain;
    toolchain.root = settings.toolchain_root;
    toolchain.install_command = settings.toolchain_install_command;
    toolchain.allow_host = settings.toolchain_allow_host;
    Execution::registerBuiltinActions(registry, toolchain);

    Cache::CacheGateOptions gate_options;
    gate_options.enabled = settings.cache_enabled;
    gate_options.default_paths = settings.cache_default_paths;

    std::shared_ptr<Cache::CacheStore> store;
    if (cli.has("dry-run")) {
        store = std::make_shared<Cache::MemoryCacheStore>();
    } else {
        store = std::make_shared<Cache::DirectoryCacheStore>(settings.cache_directory, settings.compression_level);
    }
    Cache::CacheGate gate(store, registry, gate_options);

    const std::vector<const Job*> jobs = Orchestrator::PipelineScheduler::selectJobs(pipeline, cli.getAll("job"));
    if (cli.has("dry-run")) {
        printPlan(pipeline, jobs, gate, run);
        return EXIT_OK;
    }

    Execution::ProcessRunner runner(settings.grace_period);
    Execution::StepExecutor executor(registry, runner, settings.default_shell);

    Orchestrator::JobRunnerConfig runner_config;
    runner_config.workspace_root = settings.workspace_root;
    runner_config.keep_workspace = settings.keep_workspace;
    Orchestrator::JobRunner job_runner(executor, &gate, runner_config);

    std::mutex output_mutex;
    job_runner.setStepCallback([this, &output_mutex](const std::string& job_id, const StepRecord& record) {
        std::lock_guard<std::mutex> lock(output_mutex);
        out_ << "[" << job_id << "] " << record.name << " (exit " << record.exit_code << ")\n";
        out_ << record.stdout_data;
        out_.flush();
        err_ << record.stderr_data;
    });

    Orchestrator::SchedulerConfig scheduler_config;
    scheduler_config.max_parallel_jobs = settings.max_parallel_jobs;
    scheduler_config.job_timeout = settings.job_timeout;
    scheduler_config.fail_fast = settings.fail_fast;
    Orchestrator::PipelineScheduler scheduler(job_runner, scheduler_config);

    SignalHandler& signals = SignalHandler::getInstance();
    signals.registerCleanupCallback("pipeline_cancel", [&scheduler](int signal_number) {
        scheduler.cancel("received signal " + std::to_string(signal_number));
    });
    signals.initialize();

    PipelineResult result = scheduler.run(pipeline, run, cli.getAll("job"));

    signals.unregisterCleanupCallback("pipeline_cancel");
    signals.uninstall();

    out_ << Orchestrator::PipelineUtils::summarize(result);
    if (cli.has("report") && !Orchestrator::PipelineUtils::writeReport(cli.get("report"), result)) {
        err_ << "cipctl: cannot write report " << cli.get("report") << std::endl;
    }

    if (!result.succeeded()) {
        for (const auto& job_id : result.failedJobs()) {
            err_ << "failed: " << job_id << std::endl;
        }
        return EXIT_PIPELINE_FAILED;
    }
    return EXIT_OK;
}

} // namespace CLI
} // namespace CIP
