#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/pipeline_types.hpp"

namespace CIP {
namespace Execution {

// EN: Fresh isolated workspace and variable set for one job run. Removed on destruction unless kept.
//     Toolchain PATH changes and exported variables live here, so they never leak to another job.
// FR: Workspace isolé et jeu de variables neufs pour une exécution de job. Supprimés à la destruction sauf conservation.
//     Les changements de PATH et variables exportées vivent ici, ils ne fuient jamais vers un autre job.
class JobEnvironment {
public:
    // EN: Throws EnvironmentProvisionError when the workspace cannot be created
    // FR: Lance EnvironmentProvisionError si le workspace ne peut être créé
    JobEnvironment(const std::string& job_id, const std::string& root_directory, bool keep_workspace = false);
    ~JobEnvironment();

    JobEnvironment(const JobEnvironment&) = delete;
    JobEnvironment& operator=(const JobEnvironment&) = delete;

    const std::string& jobId() const { return job_id_; }
    const std::filesystem::path& workspace() const { return workspace_; }
    const std::filesystem::path& tempDirectory() const { return temp_directory_; }
    const std::filesystem::path& baseDirectory() const { return base_directory_; }

    void setVariable(const std::string& name, const std::string& value);
    void setVariables(const Parameters& variables);
    std::optional<std::string> getVariable(const std::string& name) const;
    void unsetVariable(const std::string& name);
    const std::map<std::string, std::string>& variables() const { return variables_; }

    // EN: Put a directory in front of PATH
    // FR: Place un répertoire en tête du PATH
    void prependPath(const std::string& directory);

    // EN: "KEY=VALUE" block for a child process; overrides win over job variables
    // FR: Bloc "CLE=VALEUR" pour un processus enfant ; les surcharges l'emportent sur les variables du job
    std::vector<std::string> environmentBlock(const Parameters& overrides = {}) const;

    // EN: Resolve a step working directory; rejects paths escaping the workspace
    // FR: Résout le répertoire de travail d'une étape ; rejette les chemins sortant du workspace
    std::filesystem::path resolvePath(const std::string& relative) const;

    void setKeepWorkspace(bool keep) { keep_workspace_ = keep; }

    // EN: Whether the cache gate restored an entry before the first step
    // FR: Indique si le cache gate a restauré une entrée avant la première étape
    void setCacheHit(bool hit) { cache_hit_ = hit; }
    bool cacheHit() const { return cache_hit_; }

private:
    void importHostEnvironment();

    std::string job_id_;
    std::filesystem::path base_directory_;
    std::filesystem::path workspace_;
    std::filesystem::path temp_directory_;
    std::map<std::string, std::string> variables_;
    bool keep_workspace_;
    bool cache_hit_ = false;
};

} // namespace Execution
} // namespace CIP
