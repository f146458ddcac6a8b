#pragma once

#include <string>

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/pipeline_types.hpp"
#include "execution/action_registry.hpp"
#include "execution/job_environment.hpp"
#include "execution/process_runner.hpp"

namespace CIP {
namespace Execution {

// EN: Runs a single step (action reference or shell command) inside a job environment.
//     Success returns the step record. Failures throw:
//       - UnknownActionError for an unresolvable action reference
//       - StepFailure for a non-zero exit or a failed action (never retried)
//       - CancelledError when the token fires before or during the step
// FR: Exécute une seule étape (référence d'action ou commande shell) dans un environnement de job.
//     Un succès retourne l'enregistrement de l'étape. Les échecs lèvent :
//       - UnknownActionError pour une référence d'action non résolue
//       - StepFailure pour un code non nul ou une action échouée (jamais réessayée)
//       - CancelledError si le token se déclenche avant ou pendant l'étape
class StepExecutor {
public:
    StepExecutor(const ActionRegistry& registry, const ProcessRunner& runner, std::string default_shell = "sh");

    StepRecord execute(const Step& step, size_t index, JobEnvironment& environment,
                       const RunContext& run, const CancellationToken* token = nullptr) const;

    // EN: Replace ${{ env.NAME }} with the job variable (empty when unset)
    // FR: Remplace ${{ env.NOM }} par la variable du job (vide si absente)
    static std::string expandExpressions(const std::string& text, const JobEnvironment& environment);

    const std::string& defaultShell() const { return default_shell_; }

private:
    StepRecord executeAction(const Step& step, size_t index, JobEnvironment& environment,
                             const RunContext& run, const CancellationToken* token) const;
    StepRecord executeCommand(const Step& step, size_t index, JobEnvironment& environment,
                              const CancellationToken* token) const;

    const ActionRegistry& registry_;
    const ProcessRunner& runner_;
    std::string default_shell_;
};

} // namespace Execution
} // namespace CIP
