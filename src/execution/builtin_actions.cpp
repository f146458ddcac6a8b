#include "execution/builtin_actions.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace CIP {
namespace Execution {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(" \t\r");
        lines.push_back(line.substr(first, last - first + 1));
    }
    return lines;
}

bool isTrue(const std::optional<std::string>& value) {
    return value && (*value == "true" || *value == "1" || *value == "yes");
}

} // namespace

ActionOutcome CheckoutAction::execute(ActionContext& context) {
    const std::string& source = context.run.source_directory;
    if (source.empty()) {
        return ActionOutcome::failure("checkout: no source directory configured for this run");
    }

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return ActionOutcome::failure("checkout: source directory does not exist: " + source);
    }

    fs::path destination;
    try {
        destination = context.environment.resolvePath(findParameter(context.inputs, "path").value_or(""));
    } catch (const std::invalid_argument& e) {
        return ActionOutcome::failure("checkout: " + std::string(e.what()));
    }

    fs::create_directories(destination, ec);
    if (ec) {
        return ActionOutcome::failure("checkout: cannot create " + destination.string() + ": " + ec.message());
    }

    const bool include_git = isTrue(findParameter(context.inputs, "include-git"));
    size_t copied = 0;

    for (const auto& entry : fs::directory_iterator(source, ec)) {
        if (!include_git && entry.path().filename() == ".git") {
            continue;
        }
        fs::copy(entry.path(), destination / entry.path().filename(),
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks,
                 ec);
        if (ec) {
            return ActionOutcome::failure("checkout: failed to copy " + entry.path().string() + ": " + ec.message());
        }
        copied++;
    }
    if (ec) {
        return ActionOutcome::failure("checkout: cannot read " + source + ": " + ec.message());
    }

    context.environment.setVariable("CIP_CHECKOUT_PATH", destination.string());

    ActionOutcome outcome;
    outcome.stdout_data = "Checked out " + std::to_string(copied) + " entries from " + source +
                          " at " + (context.run.event.commit.empty() ? "working tree" : context.run.event.commit) + "\n";
    return outcome;
}

std::string ToolchainAction::toolchainName(const ActionReference& reference, const Parameters& inputs) {
    auto explicit_name = findParameter(inputs, "toolchain");
    if (explicit_name && !explicit_name->empty()) {
        return *explicit_name;
    }
    if (reference.version == "master" || reference.version == "main") {
        return "";
    }
    return reference.version;
}

ActionOutcome ToolchainAction::execute(ActionContext& context) {
    const std::string name = toolchainName(*context.step.uses, context.inputs);
    if (name.empty()) {
        return ActionOutcome::failure("toolchain: no toolchain named (set 'with.toolchain')");
    }

    const std::string components = findParameter(context.inputs, "components").value_or("");
    fs::path bin_dir = options_.root.empty() ? fs::path() : fs::path(options_.root) / name / "bin";

    ActionOutcome outcome;
    std::error_code ec;

    if (!bin_dir.empty() && fs::is_directory(bin_dir, ec)) {
        context.environment.prependPath(bin_dir.string());
        outcome.stdout_data = "Using installed toolchain " + name + " from " + bin_dir.string() + "\n";
    } else if (!options_.install_command.empty()) {
        ProcessRequest request;
        request.command = options_.install_command;
        request.shell = "sh";
        request.working_directory = context.environment.workspace().string();
        request.environment = context.environment.environmentBlock({
            {"CIP_TOOLCHAIN", name},
            {"CIP_TOOLCHAIN_ROOT", options_.root},
            {"CIP_TOOLCHAIN_COMPONENTS", components},
        });

        LOG_INFO("toolchain", "Installing toolchain " + name + " for job " + context.environment.jobId());
        ProcessResult result = context.runner.run(request, context.token);
        outcome.stdout_data = result.stdout_data;
        outcome.stderr_data = result.stderr_data;

        if (result.cancelled) {
            throw CancelledError(context.token ? context.token->reason() : "toolchain install interrupted");
        }
        if (result.exit_code != 0) {
            outcome.success = false;
            outcome.exit_code = result.exit_code;
            outcome.message = "toolchain: installer failed for " + name + " with exit code " +
                              std::to_string(result.exit_code);
            return outcome;
        }
        if (!bin_dir.empty() && fs::is_directory(bin_dir, ec)) {
            context.environment.prependPath(bin_dir.string());
        }
    } else if (options_.allow_host) {
        LOG_DEBUG("toolchain", "Toolchain " + name + " not installed under root, using host toolchain");
        outcome.stdout_data = "Using host toolchain for " + name + "\n";
    } else {
        return ActionOutcome::failure("toolchain: " + name + " is not installed and host toolchains are disabled");
    }

    context.environment.setVariable("CIP_TOOLCHAIN", name);
    context.environment.setVariable("CIP_TOOLCHAIN_COMPONENTS", components);
    return outcome;
}

ActionOutcome CacheAction::execute(ActionContext& context) {
    const bool hit = context.environment.cacheHit();
    context.environment.setVariable("CIP_CACHE_HIT", hit ? "true" : "false");

    ActionOutcome outcome;
    outcome.stdout_data = std::string("Cache ") + (hit ? "hit" : "miss") + " for job " +
                          context.environment.jobId() + "\n";
    return outcome;
}

std::optional<CacheSpec> CacheAction::cacheSpec(const Step& step) const {
    CacheSpec spec;
    spec.key = findParameter(step.with, "key").value_or(default_key_);

    auto paths = findParameter(step.with, "path");
    spec.paths = paths ? splitLines(*paths) : default_paths_;
    if (spec.paths.empty()) {
        return std::nullopt;
    }
    return spec;
}

void registerBuiltinActions(ActionRegistry& registry, const ToolchainOptions& toolchain) {
    auto checkout = std::make_shared<CheckoutAction>();
    registry.registerAction("actions/checkout", {"v2", "v3", "v4"}, checkout);

    auto toolchain_action = std::make_shared<ToolchainAction>(toolchain);
    registry.registerAction("dtolnay/rust-toolchain", {}, toolchain_action);
    registry.registerAction("cip/toolchain", {}, toolchain_action);

    registry.registerAction("Swatinem/rust-cache", {"v1", "v2"},
                            std::make_shared<CacheAction>(std::vector<std::string>{"target"},
                                                          "{job}-{os}-{hash:Cargo.lock}"));
    auto generic_cache = std::make_shared<CacheAction>(std::vector<std::string>{}, "{job}-{os}");
    registry.registerAction("actions/cache", {"v3", "v4"}, generic_cache);
    registry.registerAction("cip/cache", {"v1"}, generic_cache);
}

} // namespace Execution
} // namespace CIP
