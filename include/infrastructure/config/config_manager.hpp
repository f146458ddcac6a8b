#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace CIP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values ("section.key").
    // FR: Structure de règle de validation pour les valeurs de configuration ("section.clé").
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Existing values are replaced.
    // FR: Charge la configuration depuis un fichier YAML. Les valeurs existantes sont remplacées.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply environment overrides: PREFIX + SECTION + "__" + KEY, e.g. CIP_SCHEDULER__FAIL_FAST=true.
    // FR: Applique les surcharges d'environnement : PREFIX + SECTION + "__" + CLE, ex. CIP_SCHEDULER__FAIL_FAST=true.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CIP_");

    void addValidationRules(const std::vector<ValidationRule>& rules);
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;

    // EN: Typed lookups falling back to a default when missing or mistyped.
    // FR: Lectures typées avec repli sur une valeur par défaut si absente ou mal typée.
    int getInt(const std::string& section, const std::string& key, int default_value) const;
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_value) const;

    void reset();

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadYaml(const YAML::Node& yaml);
    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;
    std::string expandVariables(const std::string& value) const;
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    static ConfigValue parseScalar(const std::string& text);
    ConfigValue lookup(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<bool>(*value_);
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<int>(*value_);
}

template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<double>(*value_);
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::string>(*value_);
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::vector<std::string>>(*value_);
}

} // namespace CIP
