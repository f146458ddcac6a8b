#pragma once

#include <string>
#include <vector>

#include "execution/action_registry.hpp"

namespace CIP {
namespace Execution {

// EN: Copies the run's source tree into the workspace (or 'with.path' below it)
// FR: Copie l'arbre source de l'exécution dans le workspace (ou 'with.path' en dessous)
class CheckoutAction : public ActionHandler {
public:
    std::string description() const override { return "checkout"; }
    ActionOutcome execute(ActionContext& context) override;
};

struct ToolchainOptions {
    std::string root;                   // EN: <root>/<name>/bin holds installed toolchains / FR: <root>/<nom>/bin contient les toolchains installées
    std::string install_command;        // EN: External installer, exit-code contract / FR: Installeur externe, contrat par code de sortie
    bool allow_host = true;
};

// EN: Activates a named toolchain for the rest of the job by putting its bin directory on PATH
// FR: Active une toolchain nommée pour le reste du job en plaçant son répertoire bin dans le PATH
class ToolchainAction : public ActionHandler {
public:
    explicit ToolchainAction(ToolchainOptions options) : options_(std::move(options)) {}

    std::string description() const override { return "toolchain"; }
    ActionOutcome execute(ActionContext& context) override;

    // EN: 'with.toolchain' wins over the version ref; "master" alone names no toolchain
    // FR: 'with.toolchain' l'emporte sur la version ; "master" seul ne nomme aucune toolchain
    static std::string toolchainName(const ActionReference& reference, const Parameters& inputs);

private:
    ToolchainOptions options_;
};

// EN: Marks the job as cached. The cache gate restores before the first step; at step time
//     the handler only exports CIP_CACHE_HIT.
// FR: Marque le job comme mis en cache. Le cache gate restaure avant la première étape ; à l'exécution
//     le handler exporte seulement CIP_CACHE_HIT.
class CacheAction : public ActionHandler {
public:
    CacheAction(std::vector<std::string> default_paths, std::string default_key)
        : default_paths_(std::move(default_paths)), default_key_(std::move(default_key)) {}

    std::string description() const override { return "cache"; }
    ActionOutcome execute(ActionContext& context) override;
    std::optional<CacheSpec> cacheSpec(const Step& step) const override;

private:
    std::vector<std::string> default_paths_;
    std::string default_key_;
};

// EN: Registers checkout, toolchain and cache handlers under their supported names and versions
// FR: Enregistre les handlers checkout, toolchain et cache sous leurs noms et versions supportés
void registerBuiltinActions(ActionRegistry& registry, const ToolchainOptions& toolchain);

} // namespace Execution
} // namespace CIP
