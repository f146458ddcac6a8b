#include "declaration/declaration_parser.hpp"
#include "cache/cache_archive.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace CIP {
namespace Declaration {

namespace {

const std::set<std::string> ROOT_KEYS = {"name", "on", "env", "jobs"};
const std::set<std::string> JOB_KEYS = {"name", "runs-on", "timeout-minutes", "env",
                                        "continue-on-error", "cache", "steps"};
const std::set<std::string> STEP_KEYS = {"name", "uses", "with", "run", "env", "shell", "working-directory"};

std::string location(const YAML::Node& node) {
    const YAML::Mark mark = node.Mark();
    if (mark.is_null()) {
        return "";
    }
    return " (line " + std::to_string(mark.line + 1) + ")";
}

std::string scalar(const YAML::Node& node, const std::string& context) {
    if (!node.IsScalar()) {
        throw DeclarationError(context + " must be a scalar" + location(node));
    }
    return node.Scalar();
}

void checkKeys(const YAML::Node& node, const std::set<std::string>& allowed, const std::string& context) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (key == "needs") {
            throw DeclarationError(context + ": job dependencies ('needs') are not supported, jobs are independent" +
                                   location(it->first));
        }
        if (allowed.find(key) == allowed.end()) {
            throw DeclarationError(context + ": unknown key '" + key + "'" + location(it->first));
        }
    }
}

} // namespace

Pipeline DeclarationParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DeclarationError("Cannot open declaration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_DEBUG("declaration", "Parsing declaration file: " + path);
    return parseString(buffer.str());
}

Pipeline DeclarationParser::parseString(const std::string& content) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw DeclarationError("Invalid YAML: " + std::string(e.what()));
    }

    try {
        return parseRoot(root);
    } catch (const YAML::Exception& e) {
        throw DeclarationError("Invalid declaration: " + std::string(e.what()));
    }
}

bool DeclarationParser::isValidJobId(const std::string& job_id) {
    return !job_id.empty() &&
           job_id.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-") ==
               std::string::npos;
}

Pipeline DeclarationParser::parseRoot(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw DeclarationError("Declaration root must be a mapping");
    }
    checkKeys(root, ROOT_KEYS, "pipeline");

    Pipeline pipeline;
    if (root["name"]) {
        pipeline.name = scalar(root["name"], "pipeline name");
    }
    if (root["on"]) {
        pipeline.on = parseTriggers(root["on"]);
    }
    if (root["env"]) {
        pipeline.env = parseMapping(root["env"], "pipeline env");
    }

    const YAML::Node jobs = root["jobs"];
    if (!jobs || !jobs.IsMap() || jobs.size() == 0) {
        throw DeclarationError("Declaration must define a non-empty 'jobs' mapping" + location(jobs));
    }

    std::set<std::string> seen;
    for (auto it = jobs.begin(); it != jobs.end(); ++it) {
        std::string job_id = it->first.as<std::string>();
        if (!isValidJobId(job_id)) {
            throw DeclarationError("Invalid job identifier '" + job_id + "'" + location(it->first));
        }
        if (!seen.insert(job_id).second) {
            throw DeclarationError("Duplicate job identifier '" + job_id + "'" + location(it->first));
        }
        pipeline.jobs.push_back(parseJob(job_id, it->second));
    }

    return pipeline;
}

std::vector<EventKind> DeclarationParser::parseTriggers(const YAML::Node& node) {
    std::vector<std::string> names;

    if (node.IsScalar()) {
        names.push_back(node.Scalar());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            names.push_back(scalar(item, "trigger"));
        }
    } else if (node.IsMap()) {
        // EN: Per-event filters (branches, paths) are not evaluated; only the event names matter.
        // FR: Les filtres par événement (branches, paths) ne sont pas évalués ; seuls les noms comptent.
        for (auto it = node.begin(); it != node.end(); ++it) {
            names.push_back(it->first.as<std::string>());
        }
    } else if (!node.IsNull()) {
        throw DeclarationError("'on' must be a name, a list or a mapping" + location(node));
    }

    std::vector<EventKind> kinds;
    for (const auto& name : names) {
        try {
            kinds.push_back(parseEventKind(name));
        } catch (const std::invalid_argument& e) {
            throw DeclarationError(std::string(e.what()) + location(node));
        }
    }
    return kinds;
}

Job DeclarationParser::parseJob(const std::string& job_id, const YAML::Node& node) {
    const std::string context = "job '" + job_id + "'";
    if (!node.IsMap()) {
        throw DeclarationError(context + " must be a mapping" + location(node));
    }
    checkKeys(node, JOB_KEYS, context);

    Job job;
    job.id = job_id;
    if (node["name"]) job.name = scalar(node["name"], context + " name");
    if (node["runs-on"]) job.runs_on = scalar(node["runs-on"], context + " runs-on");
    if (node["timeout-minutes"]) {
        int minutes = node["timeout-minutes"].as<int>();
        if (minutes <= 0) {
            throw DeclarationError(context + ": timeout-minutes must be positive" + location(node["timeout-minutes"]));
        }
        job.timeout = std::chrono::minutes(minutes);
    }
    if (node["continue-on-error"]) job.continue_on_error = node["continue-on-error"].as<bool>();
    if (node["env"]) job.env = parseMapping(node["env"], context + " env");
    if (node["cache"]) job.cache = parseCache(job_id, node["cache"]);

    const YAML::Node steps = node["steps"];
    if (!steps || !steps.IsSequence() || steps.size() == 0) {
        throw DeclarationError(context + " must define a non-empty 'steps' list" + location(node));
    }

    size_t index = 0;
    for (const auto& step_node : steps) {
        job.steps.push_back(parseStep(job_id, index++, step_node));
    }

    return job;
}

Step DeclarationParser::parseStep(const std::string& job_id, size_t index, const YAML::Node& node) {
    const std::string context = "job '" + job_id + "' step " + std::to_string(index);
    if (!node.IsMap()) {
        throw DeclarationError(context + " must be a mapping" + location(node));
    }
    checkKeys(node, STEP_KEYS, context);

    const bool has_uses = static_cast<bool>(node["uses"]);
    const bool has_run = static_cast<bool>(node["run"]);
    if (has_uses == has_run) {
        throw DeclarationError(context + " must set exactly one of 'uses' or 'run'" + location(node));
    }

    Step step;
    if (node["name"]) step.name = scalar(node["name"], context + " name");

    if (has_uses) {
        try {
            step.uses = ActionReference::parse(scalar(node["uses"], context + " uses"));
        } catch (const std::invalid_argument& e) {
            throw DeclarationError(context + ": " + e.what() + location(node["uses"]));
        }
        if (node["with"]) step.with = parseMapping(node["with"], context + " with");
    } else {
        if (node["with"]) {
            throw DeclarationError(context + ": 'with' is only valid for action steps" + location(node["with"]));
        }
        step.run = scalar(node["run"], context + " run");
    }

    if (node["env"]) step.env = parseMapping(node["env"], context + " env");
    if (node["shell"]) step.shell = scalar(node["shell"], context + " shell");
    if (node["working-directory"]) {
        step.working_directory = scalar(node["working-directory"], context + " working-directory");
    }

    return step;
}

CacheSpec DeclarationParser::parseCache(const std::string& job_id, const YAML::Node& node) {
    const std::string context = "job '" + job_id + "' cache";
    if (!node.IsMap()) {
        throw DeclarationError(context + " must be a mapping" + location(node));
    }

    CacheSpec spec;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (key == "key") {
            spec.key = scalar(it->second, context + " key");
        } else if (key == "paths") {
            if (it->second.IsScalar()) {
                spec.paths.push_back(it->second.Scalar());
            } else if (it->second.IsSequence()) {
                for (const auto& path : it->second) {
                    spec.paths.push_back(scalar(path, context + " path"));
                }
            } else {
                throw DeclarationError(context + " paths must be a path or a list" + location(it->second));
            }
        } else {
            throw DeclarationError(context + ": unknown key '" + key + "'" + location(it->first));
        }
    }

    if (spec.paths.empty()) {
        throw DeclarationError(context + " must list at least one path" + location(node));
    }
    for (const auto& path : spec.paths) {
        if (!Cache::CacheArchive::isSafeRelative(std::filesystem::path(path).lexically_normal())) {
            throw DeclarationError(context + " path '" + path + "' must stay inside the workspace" + location(node));
        }
    }
    return spec;
}

Parameters DeclarationParser::parseMapping(const YAML::Node& node, const std::string& context) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        throw DeclarationError(context + " must be a mapping" + location(node));
    }

    Parameters parameters;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (findParameter(parameters, key)) {
            throw DeclarationError(context + ": duplicate key '" + key + "'" + location(it->first));
        }

        std::string value;
        if (it->second.IsSequence()) {
            // EN: Lists collapse to newline-separated text, the form multi-path inputs use
            // FR: Les listes deviennent du texte séparé par des retours ligne, la forme des entrées multi-chemins
            for (const auto& item : it->second) {
                if (!value.empty()) value += "\n";
                value += scalar(item, context + " '" + key + "'");
            }
        } else if (it->second.IsNull()) {
            value = "";
        } else {
            value = scalar(it->second, context + " '" + key + "'");
        }
        parameters.emplace_back(key, value);
    }
    return parameters;
}

std::string DeclarationParser::serialize(const Pipeline& pipeline) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    if (!pipeline.name.empty()) {
        out << YAML::Key << "name" << YAML::Value << pipeline.name;
    }

    if (!pipeline.on.empty()) {
        out << YAML::Key << "on" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (EventKind kind : pipeline.on) {
            out << toString(kind);
        }
        out << YAML::EndSeq;
    }

    if (!pipeline.env.empty()) {
        out << YAML::Key << "env" << YAML::Value;
        emitParameters(out, pipeline.env);
    }

    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginMap;
    for (const auto& job : pipeline.jobs) {
        out << YAML::Key << job.id << YAML::Value;
        emitJob(out, job);
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good()) {
        throw DeclarationError("Failed to serialise pipeline: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

void DeclarationParser::saveToFile(const std::string& path, const Pipeline& pipeline) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw DeclarationError("Cannot write declaration file: " + path);
    }
    file << serialize(pipeline);
    if (!file.good()) {
        throw DeclarationError("Failed to write declaration file: " + path);
    }
}

void DeclarationParser::emitParameters(YAML::Emitter& out, const Parameters& parameters) {
    out << YAML::BeginMap;
    for (const auto& [key, value] : parameters) {
        out << YAML::Key << key << YAML::Value;
        if (value.find('\n') == std::string::npos) {
            out << value;
        } else if (value.back() == '\n') {
            out << YAML::Literal << value;
        } else {
            // EN: Newline-joined text without a final newline came from a list; emit it back as one
            // FR: Un texte joint par retours ligne sans retour final vient d'une liste ; le réémet comme telle
            out << YAML::BeginSeq;
            std::istringstream lines(value);
            std::string line;
            while (std::getline(lines, line)) {
                out << line;
            }
            out << YAML::EndSeq;
        }
    }
    out << YAML::EndMap;
}

void DeclarationParser::emitJob(YAML::Emitter& out, const Job& job) {
    out << YAML::BeginMap;

    if (!job.name.empty()) out << YAML::Key << "name" << YAML::Value << job.name;
    if (!job.runs_on.empty()) out << YAML::Key << "runs-on" << YAML::Value << job.runs_on;
    if (job.timeout) {
        out << YAML::Key << "timeout-minutes" << YAML::Value << static_cast<int>(job.timeout->count());
    }
    if (job.continue_on_error) out << YAML::Key << "continue-on-error" << YAML::Value << true;
    if (!job.env.empty()) {
        out << YAML::Key << "env" << YAML::Value;
        emitParameters(out, job.env);
    }

    if (job.cache) {
        out << YAML::Key << "cache" << YAML::Value << YAML::BeginMap;
        if (!job.cache->key.empty()) out << YAML::Key << "key" << YAML::Value << job.cache->key;
        out << YAML::Key << "paths" << YAML::Value << YAML::BeginSeq;
        for (const auto& path : job.cache->paths) {
            out << path;
        }
        out << YAML::EndSeq << YAML::EndMap;
    }

    out << YAML::Key << "steps" << YAML::Value << YAML::BeginSeq;
    for (const auto& step : job.steps) {
        emitStep(out, step);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

void DeclarationParser::emitStep(YAML::Emitter& out, const Step& step) {
    out << YAML::BeginMap;

    if (!step.name.empty()) out << YAML::Key << "name" << YAML::Value << step.name;

    if (step.uses) {
        out << YAML::Key << "uses" << YAML::Value << step.uses->toString();
        if (!step.with.empty()) {
            out << YAML::Key << "with" << YAML::Value;
            emitParameters(out, step.with);
        }
    } else if (step.run) {
        out << YAML::Key << "run" << YAML::Value;
        if (step.run->find('\n') != std::string::npos && step.run->back() == '\n') {
            out << YAML::Literal << *step.run;
        } else if (step.run->find('\n') != std::string::npos) {
            out << YAML::DoubleQuoted << *step.run;
        } else {
            out << *step.run;
        }
    }

    if (!step.env.empty()) {
        out << YAML::Key << "env" << YAML::Value;
        emitParameters(out, step.env);
    }
    if (!step.shell.empty()) out << YAML::Key << "shell" << YAML::Value << step.shell;
    if (!step.working_directory.empty()) {
        out << YAML::Key << "working-directory" << YAML::Value << step.working_directory;
    }

    out << YAML::EndMap;
}

} // namespace Declaration
} // namespace CIP
