#include "orchestrator/pipeline_utils.hpp"
#include "infrastructure/logging/logger.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace CIP {
namespace Orchestrator {

std::string PipelineUtils::formatDuration(std::chrono::milliseconds duration) {
    const auto total_ms = duration.count();
    if (total_ms < 1000) {
        return std::to_string(total_ms) + "ms";
    }

    std::ostringstream oss;
    if (total_ms < 60000) {
        oss << std::fixed << std::setprecision(1) << static_cast<double>(total_ms) / 1000.0 << "s";
        return oss.str();
    }

    const auto minutes = total_ms / 60000;
    const auto seconds = (total_ms % 60000) / 1000;
    oss << minutes << "m " << std::setw(2) << std::setfill('0') << seconds << "s";
    return oss.str();
}

std::string PipelineUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    const auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::ordered_json PipelineUtils::toJson(const StepRecord& record) {
    nlohmann::ordered_json json;
    json["index"] = record.index;
    json["name"] = record.name;
    json["exit_code"] = record.exit_code;
    json["duration_ms"] = record.duration.count();
    json["stdout"] = record.stdout_data;
    json["stderr"] = record.stderr_data;
    return json;
}

nlohmann::ordered_json PipelineUtils::toJson(const RunResult& result) {
    nlohmann::ordered_json json;
    json["job"] = result.job_id;
    json["status"] = toString(result.status);
    json["exit_code"] = result.exit_code;
    json["failing_step"] = result.failing_step ? nlohmann::ordered_json(*result.failing_step)
                                               : nlohmann::ordered_json(nullptr);
    if (!result.error_kind.empty()) {
        json["error"] = {{"kind", result.error_kind}, {"message", result.error_message}};
    }
    json["continue_on_error"] = result.continue_on_error;
    json["cache"] = {
        {"restored", result.cache_restored},
        {"save_attempted", result.cache_save_attempted},
        {"saved", result.cache_saved}
    };
    json["started_at"] = formatTimestamp(result.start_time);
    json["duration_ms"] = result.duration.count();

    json["steps"] = nlohmann::ordered_json::array();
    for (const auto& step : result.steps) {
        json["steps"].push_back(toJson(step));
    }
    return json;
}

nlohmann::ordered_json PipelineUtils::toJson(const PipelineResult& result) {
    nlohmann::ordered_json json;
    json["run_id"] = result.run_id;
    json["pipeline"] = result.pipeline_name;
    json["verdict"] = toString(result.verdict);
    json["event"] = {
        {"kind", toString(result.event.kind)},
        {"ref", result.event.ref},
        {"commit", result.event.commit}
    };
    json["started_at"] = formatTimestamp(result.start_time);
    json["duration_ms"] = result.duration.count();
    json["failed_jobs"] = result.failedJobs();

    json["jobs"] = nlohmann::ordered_json::array();
    for (const auto& job : result.jobs) {
        json["jobs"].push_back(toJson(job));
    }
    return json;
}

bool PipelineUtils::writeReport(const std::string& filepath, const PipelineResult& result) {
    std::ofstream out(filepath, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("report", "Cannot open report file: " + filepath);
        return false;
    }

    out << toJson(result).dump(2) << "\n";
    if (!out.good()) {
        LOG_ERROR("report", "Failed to write report file: " + filepath);
        return false;
    }

    LOG_INFO("report", "Run report written to " + filepath);
    return true;
}

std::string PipelineUtils::summarize(const PipelineResult& result) {
    std::ostringstream oss;
    oss << "Pipeline '" << result.pipeline_name << "' " << toString(result.verdict)
        << " in " << formatDuration(result.duration) << "\n";

    for (const auto& job : result.jobs) {
        oss << "  " << std::left << std::setw(10) << toString(job.status) << " " << job.job_id
            << " (" << formatDuration(job.duration) << ")";
        if (job.failing_step) {
            oss << " step " << *job.failing_step << " exited " << job.exit_code;
        } else if (job.isCancelled() && !job.error_message.empty()) {
            oss << " " << job.error_message;
        }
        if (job.isFailure() && job.continue_on_error) {
            oss << " [continue-on-error]";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace Orchestrator
} // namespace CIP
