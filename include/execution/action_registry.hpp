#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/pipeline_types.hpp"
#include "execution/job_environment.hpp"
#include "execution/process_runner.hpp"

namespace CIP {
namespace Execution {

// EN: Everything an action handler may touch while running one step
// FR: Tout ce qu'un handler d'action peut toucher pendant l'exécution d'une étape
struct ActionContext {
    const Step& step;
    const Parameters& inputs;           // EN: 'with' after ${{ env.X }} expansion / FR: 'with' après expansion ${{ env.X }}
    JobEnvironment& environment;
    const RunContext& run;
    const ProcessRunner& runner;
    const CancellationToken* token = nullptr;
};

struct ActionOutcome {
    bool success = true;
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::string message;

    static ActionOutcome failure(const std::string& message, int exit_code = 1) {
        ActionOutcome outcome;
        outcome.success = false;
        outcome.exit_code = exit_code;
        outcome.message = message;
        outcome.stderr_data = message + "\n";
        return outcome;
    }
};

// EN: Built-in action. Handlers mutate the job environment in place and report success or failure.
// FR: Action intégrée. Les handlers modifient l'environnement du job sur place et rapportent succès ou échec.
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    virtual std::string description() const = 0;

    // EN: May throw CancelledError when the token fires during an external install
    // FR: Peut lancer CancelledError si le token se déclenche pendant une installation externe
    virtual ActionOutcome execute(ActionContext& context) = 0;

    // EN: Cache paths and key template this step contributes to the cache gate, if any
    // FR: Chemins de cache et modèle de clé que cette étape fournit au cache gate, le cas échéant
    virtual std::optional<CacheSpec> cacheSpec(const Step& step) const {
        (void)step;
        return std::nullopt;
    }
};

// EN: Closed set of handlers addressed by "name@version". Unknown names or versions fail closed.
// FR: Ensemble fermé de handlers adressés par "nom@version". Noms ou versions inconnus échouent fermé.
class ActionRegistry {
public:
    // EN: Empty version list accepts any version (the version is then an argument, e.g. a toolchain channel)
    // FR: Une liste de versions vide accepte toute version (la version est alors un argument, p.ex. un canal)
    void registerAction(const std::string& name, const std::vector<std::string>& versions,
                        std::shared_ptr<ActionHandler> handler);

    // EN: Throws UnknownActionError
    // FR: Lance UnknownActionError
    ActionHandler& resolve(const ActionReference& reference) const;

    // EN: Non-throwing lookup
    // FR: Recherche sans exception
    ActionHandler* find(const ActionReference& reference) const;

    bool hasAction(const std::string& name) const;
    std::vector<std::string> actionNames() const;
    std::vector<std::string> supportedVersions(const std::string& name) const;

private:
    struct Registration {
        std::vector<std::string> versions;
        std::shared_ptr<ActionHandler> handler;
    };

    std::map<std::string, Registration> actions_;
};

} // namespace Execution
} // namespace CIP
