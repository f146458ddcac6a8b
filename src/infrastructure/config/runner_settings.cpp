#include "infrastructure/config/runner_settings.hpp"

namespace CIP {

RunnerSettings RunnerSettings::fromConfig(const ConfigManager& config) {
    RunnerSettings settings;

    int max_parallel = config.getInt("scheduler", "max_parallel_jobs", 0);
    settings.max_parallel_jobs = max_parallel > 0 ? static_cast<size_t>(max_parallel) : 0;
    settings.job_timeout = std::chrono::seconds(
        config.getInt("scheduler", "job_timeout_seconds", static_cast<int>(settings.job_timeout.count())));
    settings.grace_period = std::chrono::milliseconds(
        config.getInt("scheduler", "grace_period_ms", static_cast<int>(settings.grace_period.count())));
    settings.fail_fast = config.getBool("scheduler", "fail_fast", settings.fail_fast);

    settings.workspace_root = config.getString("workspace", "root", settings.workspace_root);
    settings.keep_workspace = config.getBool("workspace", "keep", settings.keep_workspace);

    settings.cache_directory = config.getString("cache", "directory", settings.cache_directory);
    settings.cache_enabled = config.getBool("cache", "enabled", settings.cache_enabled);
    settings.compression_level = config.getInt("cache", "compression_level", settings.compression_level);
    ConfigValue default_paths = config.get("cache", "default_paths");
    if (auto list = default_paths.tryAs<std::vector<std::string>>()) {
        settings.cache_default_paths = *list;
    } else if (auto single = default_paths.tryAs<std::string>()) {
        settings.cache_default_paths = {*single};
    }

    settings.toolchain_root = config.getString("toolchain", "root", settings.toolchain_root);
    settings.toolchain_install_command =
        config.getString("toolchain", "install_command", settings.toolchain_install_command);
    settings.toolchain_allow_host = config.getBool("toolchain", "allow_host", settings.toolchain_allow_host);

    settings.default_shell = config.getString("executor", "default_shell", settings.default_shell);

    settings.log_level = config.getString("logging", "level", settings.log_level);
    settings.log_file = config.getString("logging", "file", settings.log_file);

    return settings;
}

std::vector<ConfigManager::ValidationRule> RunnerSettings::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule max_parallel;
    max_parallel.key = "scheduler.max_parallel_jobs";
    max_parallel.type = "int";
    max_parallel.min_value = 0;
    max_parallel.description = "Upper bound on concurrently running jobs (0 = unbounded)";
    rules.push_back(max_parallel);

    ConfigManager::ValidationRule timeout;
    timeout.key = "scheduler.job_timeout_seconds";
    timeout.type = "int";
    timeout.min_value = 1;
    timeout.description = "Per-job timeout before forced cancellation";
    rules.push_back(timeout);

    ConfigManager::ValidationRule grace;
    grace.key = "scheduler.grace_period_ms";
    grace.type = "int";
    grace.min_value = 0;
    grace.description = "Delay between graceful and forced process termination";
    rules.push_back(grace);

    ConfigManager::ValidationRule fail_fast;
    fail_fast.key = "scheduler.fail_fast";
    fail_fast.type = "bool";
    rules.push_back(fail_fast);

    ConfigManager::ValidationRule keep;
    keep.key = "workspace.keep";
    keep.type = "bool";
    rules.push_back(keep);

    ConfigManager::ValidationRule cache_enabled;
    cache_enabled.key = "cache.enabled";
    cache_enabled.type = "bool";
    rules.push_back(cache_enabled);

    ConfigManager::ValidationRule level;
    level.key = "cache.compression_level";
    level.type = "int";
    level.min_value = 0;
    level.max_value = 9;
    rules.push_back(level);

    ConfigManager::ValidationRule allow_host;
    allow_host.key = "toolchain.allow_host";
    allow_host.type = "bool";
    rules.push_back(allow_host);

    ConfigManager::ValidationRule shell;
    shell.key = "executor.default_shell";
    shell.type = "string";
    shell.allowed_values = {"sh", "bash"};
    rules.push_back(shell);

    ConfigManager::ValidationRule log_level;
    log_level.key = "logging.level";
    log_level.type = "string";
    log_level.allowed_values = {"DEBUG", "INFO", "WARN", "ERROR", "debug", "info", "warn", "error"};
    rules.push_back(log_level);

    return rules;
}

} // namespace CIP
