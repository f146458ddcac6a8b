#include "core/pipeline_types.hpp"

#include <algorithm>
#include <stdexcept>

namespace CIP {

std::optional<std::string> findParameter(const Parameters& parameters, const std::string& key) {
    for (const auto& [name, value] : parameters) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

void setParameter(Parameters& parameters, const std::string& key, const std::string& value) {
    for (auto& entry : parameters) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    parameters.emplace_back(key, value);
}

std::string toString(EventKind kind) {
    switch (kind) {
        case EventKind::PUSH: return "push";
        case EventKind::PULL_REQUEST: return "pull_request";
        case EventKind::MANUAL: return "manual";
    }
    return "unknown";
}

EventKind parseEventKind(const std::string& text) {
    if (text == "push") return EventKind::PUSH;
    if (text == "pull_request") return EventKind::PULL_REQUEST;
    // EN: workflow_dispatch is the declaration spelling of a manual run
    // FR: workflow_dispatch est l'écriture déclarative d'un lancement manuel
    if (text == "manual" || text == "workflow_dispatch") return EventKind::MANUAL;
    throw std::invalid_argument("Unknown event kind: " + text);
}

ActionReference ActionReference::parse(const std::string& text) {
    auto at = text.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 == text.size()) {
        throw std::invalid_argument("Action reference must be 'name@version': " + text);
    }
    return ActionReference{text.substr(0, at), text.substr(at + 1)};
}

std::string ActionReference::toString() const {
    return name + "@" + version;
}

std::string Step::displayName() const {
    if (!name.empty()) {
        return name;
    }
    if (uses) {
        return uses->toString();
    }
    if (run) {
        return run->substr(0, run->find('\n'));
    }
    return "";
}

const Job* Pipeline::findJob(const std::string& id) const {
    auto it = std::find_if(jobs.begin(), jobs.end(), [&id](const Job& job) { return job.id == id; });
    return it == jobs.end() ? nullptr : &*it;
}

bool Pipeline::acceptsEvent(EventKind kind) const {
    return on.empty() || std::find(on.begin(), on.end(), kind) != on.end();
}

std::string toString(JobStatus status) {
    switch (status) {
        case JobStatus::SUCCESS: return "success";
        case JobStatus::FAILURE: return "failure";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string toString(PipelineState state) {
    switch (state) {
        case PipelineState::PENDING: return "pending";
        case PipelineState::RUNNING: return "running";
        case PipelineState::SUCCEEDED: return "succeeded";
        case PipelineState::FAILED: return "failed";
    }
    return "unknown";
}

std::vector<std::string> PipelineResult::failedJobs() const {
    std::vector<std::string> failed;
    for (const auto& job : jobs) {
        if (!job.isSuccess() && !(job.isFailure() && job.continue_on_error)) {
            failed.push_back(job.job_id);
        }
    }
    return failed;
}

} // namespace CIP
