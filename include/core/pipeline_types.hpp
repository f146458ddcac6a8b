#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CIP {

// EN: Ordered key/value list. Declaration order is kept so a parsed pipeline re-serialises unchanged.
// FR: Liste clé/valeur ordonnée. L'ordre de déclaration est conservé pour une re-sérialisation identique.
using Parameters = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> findParameter(const Parameters& parameters, const std::string& key);

// EN: Insert or replace, keeping the position of an existing key
// FR: Insère ou remplace, en gardant la position d'une clé existante
void setParameter(Parameters& parameters, const std::string& key, const std::string& value);

// EN: Repository event kinds that can trigger a pipeline
// FR: Types d'événements de dépôt pouvant déclencher un pipeline
enum class EventKind {
    PUSH = 0,
    PULL_REQUEST = 1,
    MANUAL = 2
};

std::string toString(EventKind kind);
EventKind parseEventKind(const std::string& text);

// EN: Event delivered by the trigger listener. No authenticity validation.
// FR: Événement livré par le trigger listener. Aucune validation d'authenticité.
struct TriggerEvent {
    std::string ref;
    std::string commit;
    EventKind kind = EventKind::PUSH;
};

// EN: Per-run inputs shared read-only by every job of one pipeline run
// FR: Entrées d'une exécution partagées en lecture seule par tous les jobs
struct RunContext {
    std::string run_id;
    TriggerEvent event;
    std::string source_directory;   // EN: Tree copied by checkout and hashed by cache keys / FR: Arbre copié par checkout et hashé par les clés de cache
};

// EN: "name@version" reference to a built-in action
// FR: Référence "nom@version" vers une action intégrée
struct ActionReference {
    std::string name;
    std::string version;

    // EN: Throws std::invalid_argument when the text has no '@' or an empty side
    // FR: Lance std::invalid_argument si le texte n'a pas de '@' ou un côté vide
    static ActionReference parse(const std::string& text);
    std::string toString() const;

    bool operator==(const ActionReference& other) const {
        return name == other.name && version == other.version;
    }
};

// EN: One step of a job. Exactly one of uses/run is set.
// FR: Une étape d'un job. Exactement un de uses/run est défini.
struct Step {
    std::string name;
    std::optional<ActionReference> uses;
    Parameters with;
    std::optional<std::string> run;
    Parameters env;
    std::string shell;                  // EN: Empty = executor default / FR: Vide = défaut de l'exécuteur
    std::string working_directory;      // EN: Relative to the workspace / FR: Relatif au workspace

    bool isAction() const { return uses.has_value(); }

    // EN: Declared name, else the action reference or the first line of the command
    // FR: Nom déclaré, sinon la référence d'action ou la première ligne de la commande
    std::string displayName() const;
};

struct CacheSpec {
    std::string key;                    // EN: Key template, may be empty / FR: Modèle de clé, peut être vide
    std::vector<std::string> paths;     // EN: Relative to the workspace / FR: Relatifs au workspace
};

struct Job {
    std::string id;
    std::string name;
    std::string runs_on;
    std::optional<std::chrono::minutes> timeout;
    Parameters env;
    bool continue_on_error = false;
    std::optional<CacheSpec> cache;
    std::vector<Step> steps;

    std::string displayName() const { return name.empty() ? id : name; }
};

struct Pipeline {
    std::string name;
    std::vector<EventKind> on;          // EN: Empty = every event / FR: Vide = tous les événements
    Parameters env;
    std::vector<Job> jobs;

    const Job* findJob(const std::string& id) const;
    bool acceptsEvent(EventKind kind) const;
};

// EN: Terminal outcome of one job run
// FR: Issue terminale d'une exécution de job
enum class JobStatus {
    SUCCESS = 0,
    FAILURE = 1,
    CANCELLED = 2
};

std::string toString(JobStatus status);

// EN: Captured output and exit code of one executed step
// FR: Sortie capturée et code de sortie d'une étape exécutée
struct StepRecord {
    size_t index = 0;
    std::string name;
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds duration{0};
};

struct RunResult {
    std::string job_id;
    JobStatus status = JobStatus::FAILURE;
    int exit_code = 0;
    std::optional<size_t> failing_step;
    std::string error_kind;
    std::string error_message;
    std::vector<StepRecord> steps;
    bool continue_on_error = false;
    bool cache_restored = false;
    bool cache_save_attempted = false;
    bool cache_saved = false;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};

    bool isSuccess() const { return status == JobStatus::SUCCESS; }
    bool isFailure() const { return status == JobStatus::FAILURE; }
    bool isCancelled() const { return status == JobStatus::CANCELLED; }
};

// EN: Pipeline state machine: Pending -> Running -> {Succeeded, Failed}
// FR: Machine à états du pipeline : Pending -> Running -> {Succeeded, Failed}
enum class PipelineState {
    PENDING = 0,
    RUNNING = 1,
    SUCCEEDED = 2,
    FAILED = 3
};

std::string toString(PipelineState state);

struct PipelineResult {
    std::string run_id;
    std::string pipeline_name;
    PipelineState verdict = PipelineState::PENDING;
    TriggerEvent event;
    std::vector<RunResult> jobs;        // EN: Declaration order / FR: Ordre de déclaration
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return verdict == PipelineState::SUCCEEDED; }

    // EN: Jobs whose outcome counts against the verdict
    // FR: Jobs dont l'issue compte contre le verdict
    std::vector<std::string> failedJobs() const;
};

} // namespace CIP
