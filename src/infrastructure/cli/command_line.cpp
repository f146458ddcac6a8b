#include "infrastructure/cli/command_line.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace CIP {
namespace CLI {

namespace {

const char* const CIP_VERSION = "1.0.0";

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isNonNegativeInteger(const std::string& value) {
    return !value.empty() && value.size() < 10 &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
    if (result.status == CliParseStatus::SUCCESS) {
        result.status = status;
    }
    result.errors.push_back(message);
}

} // namespace

std::string CliParseResult::get(const std::string& name, const std::string& default_value) const {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) {
        return default_value;
    }
    return it->second.back();
}

std::vector<std::string> CliParseResult::getAll(const std::string& name) const {
    auto it = values.find(name);
    return it == values.end() ? std::vector<std::string>{} : it->second;
}

CommandLineParser::CommandLineParser() {
    addOption({"help", 'h', CliOptionType::BOOLEAN, "Show this help and exit", "", "", {}, false});
    addOption({"version", 'V', CliOptionType::BOOLEAN, "Show version and exit", "", "", {}, false});
}

void CommandLineParser::addOption(const CliOptionDefinition& option_def) {
    options_.erase(std::remove_if(options_.begin(), options_.end(),
                                  [&](const CliOptionDefinition& existing) {
                                      return existing.long_name == option_def.long_name;
                                  }),
                   options_.end());
    options_.push_back(option_def);
}

void CommandLineParser::addStandardOptions() {
    addOption({"config", 'c', CliOptionType::STRING, "Runner configuration file (YAML)", "FILE", "", {}, false});
    addOption({"job", 'j', CliOptionType::STRING, "Run only this job (repeatable)", "NAME", "", {}, true});
    addOption({"source", 's', CliOptionType::STRING, "Source tree used by checkout and cache keys", "DIR", "", {}, false});
    addOption({"workdir", 'w', CliOptionType::STRING, "Root directory for job workspaces", "DIR",
               "workspace.root", {}, false});
    addOption({"cache-dir", std::nullopt, CliOptionType::STRING, "Cache storage directory", "DIR",
               "cache.directory", {}, false});
    addOption({"event", 'e', CliOptionType::STRING, "Trigger event kind", "KIND", "",
               {"push", "pull_request", "manual", "workflow_dispatch"}, false});
    addOption({"ref", std::nullopt, CliOptionType::STRING, "Trigger ref (branch or tag)", "REF", "", {}, false});
    addOption({"sha", std::nullopt, CliOptionType::STRING, "Trigger commit", "SHA", "", {}, false});
    addOption({"report", 'r', CliOptionType::STRING, "Write a JSON run report", "FILE", "", {}, false});
    addOption({"log-level", 'l', CliOptionType::STRING, "Log level", "LEVEL", "logging.level",
               {"debug", "info", "warn", "error"}, false});
    addOption({"log-file", std::nullopt, CliOptionType::STRING, "Write logs to this file instead of stderr", "FILE",
               "logging.file", {}, false});
    addOption({"max-parallel", std::nullopt, CliOptionType::INTEGER, "Maximum concurrent jobs (0 = all)", "N",
               "scheduler.max_parallel_jobs", {}, false});
    addOption({"fail-fast", std::nullopt, CliOptionType::BOOLEAN, "Cancel running jobs on the first failure", "",
               "scheduler.fail_fast", {}, false});
    addOption({"dry-run", 'n', CliOptionType::BOOLEAN, "Print the execution plan without running anything", "", "",
               {}, false});
    addOption({"keep-workspace", std::nullopt, CliOptionType::BOOLEAN, "Keep job workspaces after the run", "",
               "workspace.keep", {}, false});
}

const CliOptionDefinition* CommandLineParser::findLong(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CliOptionDefinition* CommandLineParser::findShort(char name) const {
    for (const auto& option : options_) {
        if (option.short_name && *option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::storeValue(const CliOptionDefinition& option, const std::string& value,
                                   CliParseResult& result) const {
    if (!option.repeatable && result.has(option.long_name)) {
        fail(result, CliParseStatus::DUPLICATE_OPTION, "Option --" + option.long_name + " given more than once");
        return false;
    }

    std::string stored = value;
    if (!option.enum_values.empty()) {
        stored = toLower(value);
        if (!option.enum_values.count(stored)) {
            std::string accepted;
            for (const auto& candidate : option.enum_values) {
                accepted += (accepted.empty() ? "" : ", ") + candidate;
            }
            fail(result, CliParseStatus::INVALID_VALUE,
                 "Invalid value '" + value + "' for --" + option.long_name + " (expected one of: " + accepted + ")");
            return false;
        }
    }

    ConfigValue config_value;
    switch (option.type) {
        case CliOptionType::BOOLEAN:
            config_value = ConfigValue(true);
            break;
        case CliOptionType::INTEGER:
            if (!isNonNegativeInteger(value)) {
                fail(result, CliParseStatus::INVALID_VALUE,
                     "Option --" + option.long_name + " expects a non-negative integer, got '" + value + "'");
                return false;
            }
            config_value = ConfigValue(std::stoi(value));
            break;
        case CliOptionType::STRING:
            config_value = ConfigValue(stored);
            break;
    }

    result.values[option.long_name].push_back(stored);
    if (!option.config_path.empty()) {
        result.overrides[option.config_path] = config_value;
    }
    return true;
}

CliParseResult CommandLineParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CommandLineParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;
    std::vector<std::string> positionals;
    bool options_done = false;

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const CliOptionDefinition* option = nullptr;
        std::optional<std::string> inline_value;
        std::string display = arg;

        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            const size_t equals = name.find('=');
            if (equals != std::string::npos) {
                inline_value = name.substr(equals + 1);
                name = name.substr(0, equals);
            }
            option = findLong(name);
            display = "--" + name;
        } else {
            option = findShort(arg[1]);
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
            }
        }

        if (!option) {
            fail(result, CliParseStatus::INVALID_OPTION, "Unknown option " + display);
            continue;
        }

        if (option->type == CliOptionType::BOOLEAN) {
            if (inline_value) {
                fail(result, CliParseStatus::INVALID_VALUE, "Option --" + option->long_name + " takes no value");
                continue;
            }
            storeValue(*option, "true", result);
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < arguments.size()) {
            value = arguments[++i];
        } else {
            fail(result, CliParseStatus::MISSING_VALUE, "Option --" + option->long_name + " requires a value");
            continue;
        }
        storeValue(*option, value, result);
    }

    if (result.has("help")) {
        result.status = CliParseStatus::HELP_REQUESTED;
        result.help_text = generateHelpText();
        return result;
    }
    if (result.has("version")) {
        result.status = CliParseStatus::VERSION_REQUESTED;
        result.version_text = generateVersionText();
        return result;
    }
    if (!result.ok()) {
        return result;
    }

    if (positionals.empty()) {
        fail(result, CliParseStatus::MISSING_ARGUMENT, "Missing command (run, validate or list)");
        return result;
    }

    const auto command = CommandLineUtils::parseCommand(positionals[0]);
    if (!command) {
        fail(result, CliParseStatus::UNKNOWN_COMMAND, "Unknown command '" + positionals[0] + "'");
        return result;
    }
    result.command = *command;

    if (positionals.size() < 2) {
        fail(result, CliParseStatus::MISSING_ARGUMENT,
             "Command '" + positionals[0] + "' requires a declaration file");
        return result;
    }
    if (positionals.size() > 2) {
        fail(result, CliParseStatus::INVALID_OPTION, "Unexpected argument '" + positionals[2] + "'");
        return result;
    }
    result.declaration_file = positionals[1];

    return result;
}

std::string CommandLineParser::generateHelpText(const std::string& program_name) const {
    std::ostringstream oss;
    oss << "Usage: " << program_name << " COMMAND <declaration-file> [OPTIONS]\n\n";
    oss << "Commands:\n";
    oss << "  run        Run the pipeline's jobs and report the verdict\n";
    oss << "  validate   Parse the declaration and print it normalised\n";
    oss << "  list       List job ids and names\n\n";
    oss << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name ? std::string("-") + *option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (option.type != CliOptionType::BOOLEAN) {
            flags += " " + option.value_name;
        }
        oss << "  " << std::left << std::setw(28) << flags << option.description << "\n";
    }

    oss << "\nExit status: 0 when the pipeline succeeds, 1 when it fails, 2 on usage or declaration errors.\n";
    return oss.str();
}

std::string CommandLineParser::generateVersionText() {
    return std::string("cipctl ") + CIP_VERSION;
}

size_t CommandLineParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        const size_t dot = path.find('.');
        if (dot == std::string::npos) {
            continue;
        }
        config.set(path.substr(0, dot), path.substr(dot + 1), value);
        applied++;
    }
    return applied;
}

namespace CommandLineUtils {

std::string commandToString(CliCommand command) {
    switch (command) {
        case CliCommand::RUN: return "run";
        case CliCommand::VALIDATE: return "validate";
        case CliCommand::LIST: return "list";
        default: return "none";
    }
}

std::optional<CliCommand> parseCommand(const std::string& text) {
    if (text == "run") return CliCommand::RUN;
    if (text == "validate") return CliCommand::VALIDATE;
    if (text == "list") return CliCommand::LIST;
    return std::nullopt;
}

std::string parseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::DUPLICATE_OPTION: return "DUPLICATE_OPTION";
        case CliParseStatus::MISSING_ARGUMENT: return "MISSING_ARGUMENT";
        case CliParseStatus::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        default: return "UNKNOWN";
    }
}

} // namespace CommandLineUtils

} // namespace CLI
} // namespace CIP
