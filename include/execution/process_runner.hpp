#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "core/cancellation.hpp"

namespace CIP {
namespace Execution {

// EN: Which captured stream a chunk of output came from
// FR: Flux capturé d'où provient un morceau de sortie
enum class OutputStream {
    STDOUT = 1,
    STDERR = 2
};

// EN: Receives output chunks as they are read, e.g. to echo step output live
// FR: Reçoit les morceaux de sortie à la lecture, p.ex. pour afficher la sortie d'une étape en direct
using OutputCallback = std::function<void(OutputStream stream, const std::string& chunk)>;

struct ProcessRequest {
    std::string command;                        // EN: Script passed to "<shell> -e -c" / FR: Script passé à "<shell> -e -c"
    std::string shell = "sh";
    std::string working_directory;              // EN: Empty = inherit / FR: Vide = hérité
    std::vector<std::string> environment;       // EN: Complete "KEY=VALUE" block / FR: Bloc "CLE=VALEUR" complet
};

struct ProcessResult {
    int exit_code = 0;                          // EN: 128 + signal when killed / FR: 128 + signal si tué
    std::string stdout_data;
    std::string stderr_data;
    bool cancelled = false;
    int term_signal = 0;
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return exit_code == 0 && !cancelled; }
};

// EN: Runs one shell command in its own process group and captures stdout/stderr separately.
//     On cancellation the whole group receives SIGTERM, then SIGKILL once the grace period expires.
// FR: Exécute une commande shell dans son propre groupe de processus et capture stdout/stderr séparément.
//     À l'annulation le groupe reçoit SIGTERM, puis SIGKILL à l'expiration du délai de grâce.
class ProcessRunner {
public:
    explicit ProcessRunner(std::chrono::milliseconds grace_period = std::chrono::milliseconds(5000));

    void setOutputCallback(OutputCallback callback) { output_callback_ = std::move(callback); }
    std::chrono::milliseconds gracePeriod() const { return grace_period_; }

    // EN: Blocks until the process group has exited. Throws std::runtime_error when the process cannot be spawned.
    // FR: Bloque jusqu'à la fin du groupe de processus. Lance std::runtime_error si le processus ne peut être lancé.
    ProcessResult run(const ProcessRequest& request, const CancellationToken* token = nullptr) const;

    // EN: Resolve a program name against the PATH of a "KEY=VALUE" block
    // FR: Résout un nom de programme selon le PATH d'un bloc "CLE=VALEUR"
    static std::string resolveExecutable(const std::string& program, const std::vector<std::string>& environment);

private:
    std::chrono::milliseconds grace_period_;
    OutputCallback output_callback_;
};

} // namespace Execution
} // namespace CIP
