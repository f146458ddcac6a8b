#include "execution/job_environment.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

extern char** environ;

namespace CIP {
namespace Execution {

JobEnvironment::JobEnvironment(const std::string& job_id, const std::string& root_directory, bool keep_workspace)
    : job_id_(job_id), keep_workspace_(keep_workspace) {

    std::error_code ec;
    std::filesystem::path root = root_directory.empty()
        ? std::filesystem::temp_directory_path(ec)
        : std::filesystem::path(root_directory);
    if (ec) {
        throw EnvironmentProvisionError("No temporary directory available: " + ec.message());
    }

    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw EnvironmentProvisionError("Cannot create workspace root " + root.string() + ": " + ec.message());
    }

    std::string pattern = (root / ("cip-" + job_id + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        throw EnvironmentProvisionError("Cannot allocate workspace for job '" + job_id + "': " +
                                        std::string(std::strerror(errno)));
    }
    base_directory_ = std::filesystem::path(buffer.data());
    workspace_ = base_directory_ / "workspace";
    temp_directory_ = base_directory_ / "tmp";

    std::filesystem::create_directories(workspace_, ec);
    if (!ec) std::filesystem::create_directories(temp_directory_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove_all(base_directory_, ignored);
        throw EnvironmentProvisionError("Cannot create workspace directories: " + ec.message());
    }

    importHostEnvironment();
    variables_["CIP_WORKSPACE"] = workspace_.string();
    variables_["TMPDIR"] = temp_directory_.string();

    LOG_DEBUG("environment", "Provisioned workspace " + workspace_.string() + " for job " + job_id_);
}

JobEnvironment::~JobEnvironment() {
    if (keep_workspace_) {
        LOG_INFO("environment", "Keeping workspace " + base_directory_.string());
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(base_directory_, ec);
    if (ec) {
        LOG_WARN("environment", "Failed to remove workspace " + base_directory_.string() + ": " + ec.message());
    }
}

void JobEnvironment::importHostEnvironment() {
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        variables_[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
}

void JobEnvironment::setVariable(const std::string& name, const std::string& value) {
    variables_[name] = value;
}

void JobEnvironment::setVariables(const Parameters& variables) {
    for (const auto& [name, value] : variables) {
        variables_[name] = value;
    }
}

std::optional<std::string> JobEnvironment::getVariable(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JobEnvironment::unsetVariable(const std::string& name) {
    variables_.erase(name);
}

void JobEnvironment::prependPath(const std::string& directory) {
    auto it = variables_.find("PATH");
    if (it == variables_.end() || it->second.empty()) {
        variables_["PATH"] = directory;
    } else {
        it->second = directory + ":" + it->second;
    }
}

std::vector<std::string> JobEnvironment::environmentBlock(const Parameters& overrides) const {
    std::map<std::string, std::string> merged = variables_;
    for (const auto& [name, value] : overrides) {
        merged[name] = value;
    }

    std::vector<std::string> block;
    block.reserve(merged.size());
    for (const auto& [name, value] : merged) {
        block.push_back(name + "=" + value);
    }
    return block;
}

std::filesystem::path JobEnvironment::resolvePath(const std::string& relative) const {
    if (relative.empty()) {
        return workspace_;
    }

    std::filesystem::path candidate = (workspace_ / relative).lexically_normal();
    auto mismatch = std::mismatch(workspace_.begin(), workspace_.end(), candidate.begin(), candidate.end());
    if (mismatch.first != workspace_.end()) {
        throw std::invalid_argument("Path escapes the workspace: " + relative);
    }
    return candidate;
}

} // namespace Execution
} // namespace CIP
