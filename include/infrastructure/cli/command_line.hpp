// EN: Command line parsing for cipctl - subcommands, options and configuration overrides
// FR: Analyse de la ligne de commande pour cipctl - sous-commandes, options et surcharges de configuration

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace CIP {
namespace CLI {

// EN: CLI option value types
// FR: Types de valeur des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag without value / FR: Drapeau sans valeur
    INTEGER,        // EN: Non-negative integer / FR: Entier non négatif
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,         // EN: Unknown option / FR: Option inconnue
    MISSING_VALUE,          // EN: Option value missing / FR: Valeur d'option manquante
    INVALID_VALUE,          // EN: Value rejected by type or enum check / FR: Valeur rejetée par le type ou l'énumération
    DUPLICATE_OPTION,       // EN: Non-repeatable option given twice / FR: Option non répétable donnée deux fois
    MISSING_ARGUMENT,       // EN: Command or declaration file missing / FR: Commande ou fichier de déclaration manquant
    UNKNOWN_COMMAND
};

enum class CliCommand {
    NONE,
    RUN,
    VALIDATE,
    LIST
};

// EN: CLI option definition
// FR: Définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                         // EN: Without leading dashes / FR: Sans tirets initiaux
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string value_name = "VALUE";
    std::string config_path;                       // EN: "section.key" overridden by this option, if any / FR: "section.key" surchargé par cette option, le cas échéant
    std::set<std::string> enum_values;             // EN: Accepted values, case-insensitive / FR: Valeurs acceptées, insensibles à la casse
    bool repeatable = false;
};

// EN: CLI parsing result
// FR: Résultat d'analyse CLI
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    CliCommand command = CliCommand::NONE;
    std::string declaration_file;
    std::map<std::string, std::vector<std::string>> values;     // EN: Raw values by long name / FR: Valeurs brutes par nom long
    std::unordered_map<std::string, ConfigValue> overrides;     // EN: "section.key" -> value
    std::vector<std::string> errors;
    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& name) const { return values.count(name) > 0; }
    std::string get(const std::string& name, const std::string& default_value = "") const;
    std::vector<std::string> getAll(const std::string& name) const;
};

class CommandLineParser {
public:
    CommandLineParser();

    void addOption(const CliOptionDefinition& option_def);

    // EN: Registers every cipctl option
    // FR: Enregistre toutes les options de cipctl
    void addStandardOptions();

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText(const std::string& program_name = "cipctl") const;
    static std::string generateVersionText();

    // EN: Writes parsed overrides into the configuration; returns how many were applied
    // FR: Écrit les surcharges analysées dans la configuration ; retourne le nombre appliqué
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    const CliOptionDefinition* findLong(const std::string& name) const;
    const CliOptionDefinition* findShort(char name) const;
    bool storeValue(const CliOptionDefinition& option, const std::string& value, CliParseResult& result) const;

    std::vector<CliOptionDefinition> options_;
};

namespace CommandLineUtils {
    std::string commandToString(CliCommand command);
    std::optional<CliCommand> parseCommand(const std::string& text);
    std::string parseStatusToString(CliParseStatus status);
}

} // namespace CLI
} // namespace CIP
