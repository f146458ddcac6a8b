#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace CIP {

// EN: Root of the pipeline error taxonomy. Cache misses are not errors (std::nullopt).
// FR: Racine de la taxonomie d'erreurs du pipeline. Les cache miss ne sont pas des erreurs (std::nullopt).
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}

    // EN: Stable identifier used in run results and reports
    // FR: Identifiant stable utilisé dans les résultats et rapports
    virtual const char* kind() const noexcept { return "PipelineError"; }
};

// EN: Action reference that names no known handler, or a known handler at an unsupported version
// FR: Référence d'action qui ne nomme aucun handler connu, ou un handler connu dans une version non supportée
class UnknownActionError : public PipelineError {
public:
    explicit UnknownActionError(const std::string& reference)
        : PipelineError("Unknown action: " + reference), reference_(reference) {}

    const std::string& reference() const { return reference_; }
    const char* kind() const noexcept override { return "UnknownActionError"; }

private:
    std::string reference_;
};

// EN: A step exited non-zero or its action handler reported failure. Never retried.
// FR: Une étape a terminé avec un code non nul ou son handler d'action a échoué. Jamais réessayée.
class StepFailure : public PipelineError {
public:
    StepFailure(const std::string& message, int exit_code,
                std::string stdout_data = "", std::string stderr_data = "")
        : PipelineError(message), exit_code_(exit_code),
          stdout_(std::move(stdout_data)), stderr_(std::move(stderr_data)) {}

    int exitCode() const { return exit_code_; }
    const std::string& stdoutData() const { return stdout_; }
    const std::string& stderrData() const { return stderr_; }
    const char* kind() const noexcept override { return "StepFailure"; }

private:
    int exit_code_;
    std::string stdout_;
    std::string stderr_;
};

// EN: The isolated job environment could not be created
// FR: L'environnement isolé du job n'a pas pu être créé
class EnvironmentProvisionError : public PipelineError {
public:
    explicit EnvironmentProvisionError(const std::string& message) : PipelineError(message) {}
    const char* kind() const noexcept override { return "EnvironmentProvisionError"; }
};

// EN: Cache save failed. Logged by the cache gate, never fails a job.
// FR: Échec de sauvegarde du cache. Loggé par le cache gate, ne fait jamais échouer un job.
class CacheWriteError : public PipelineError {
public:
    CacheWriteError(const std::string& key, const std::string& reason)
        : PipelineError("Cache write failed for '" + key + "': " + reason), key_(key) {}

    const std::string& key() const { return key_; }
    const char* kind() const noexcept override { return "CacheWriteError"; }

private:
    std::string key_;
};

// EN: Malformed pipeline declaration. Fatal before any job starts.
// FR: Déclaration de pipeline malformée. Fatale avant le démarrage de tout job.
class DeclarationError : public PipelineError {
public:
    explicit DeclarationError(const std::string& message) : PipelineError(message) {}
    const char* kind() const noexcept override { return "DeclarationError"; }
};

// EN: Carries a cancellation (user request, fail-fast or timeout) out of a running step
// FR: Transporte une annulation (demande utilisateur, fail-fast ou timeout) hors d'une étape en cours
class CancelledError : public PipelineError {
public:
    explicit CancelledError(const std::string& reason)
        : PipelineError("Cancelled: " + reason), reason_(reason) {}

    const std::string& reason() const { return reason_; }
    const char* kind() const noexcept override { return "Cancelled"; }

private:
    std::string reason_;
};

} // namespace CIP
