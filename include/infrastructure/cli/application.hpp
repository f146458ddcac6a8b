// EN: cipctl application - runs, validates or lists a pipeline declaration from parsed arguments
// FR: Application cipctl - exécute, valide ou liste une déclaration de pipeline à partir des arguments

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/pipeline_types.hpp"
#include "infrastructure/cli/command_line.hpp"
#include "infrastructure/config/runner_settings.hpp"

namespace CIP {

namespace Cache { class CacheGate; }

namespace CLI {

constexpr int EXIT_OK = 0;
constexpr int EXIT_PIPELINE_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// EN: Exit code is 0 iff the verdict is Succeeded (or the event does not trigger the pipeline),
//     1 when the pipeline failed, 2 on usage, configuration or declaration errors.
// FR: Code de sortie 0 ssi le verdict est Succeeded (ou si l'événement ne déclenche pas le pipeline),
//     1 si le pipeline a échoué, 2 sur erreur d'usage, de configuration ou de déclaration.
class Application {
public:
    Application(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    int run(int argc, char* argv[]);
    int run(const std::vector<std::string>& arguments);

private:
    int execute(const CliParseResult& cli);
    bool loadSettings(const CliParseResult& cli, RunnerSettings& settings);
    bool setupLogging(const RunnerSettings& settings);
    int listJobs(const Pipeline& pipeline);
    void printPlan(const Pipeline& pipeline, const std::vector<const Job*>& jobs, const Cache::CacheGate& gate,
                   const RunContext& run);
    int runPipeline(const CliParseResult& cli, const Pipeline& pipeline, const RunnerSettings& settings);

    std::ostream& out_;
    std::ostream& err_;
};

} // namespace CLI
} // namespace CIP
