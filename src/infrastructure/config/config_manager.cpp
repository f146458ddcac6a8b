// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges d'environnement et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

extern char** environ;

namespace CIP {

template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    try {
        return std::get<T>(*value_);
    } catch (const std::bad_variant_access&) {
        throw std::runtime_error("ConfigValue type mismatch");
    }
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* stored = std::get_if<T>(&*value_)) {
        return *stored;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        if (!loadYaml(yaml)) {
            return false;
        }

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!loadYaml(yaml)) {
            return false;
        }
        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadYaml(const YAML::Node& yaml) {
    if (yaml.IsNull()) {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
        return true;
    }
    if (!yaml.IsMap()) {
        LOG_ERROR("config", "Configuration root must be a mapping of sections");
        return false;
    }

    // EN: Build the new sections first so a malformed document leaves the old state untouched.
    // FR: Construit d'abord les nouvelles sections pour qu'un document invalide laisse l'ancien état intact.
    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sections_ = std::move(loaded);
    return true;
}

ConfigValue ConfigManager::parseScalar(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }

    static const std::regex int_pattern(R"(^[-+]?[0-9]+$)");
    static const std::regex double_pattern(R"(^[-+]?[0-9]*\.[0-9]+([eE][-+]?[0-9]+)?$)");

    if (std::regex_match(text, int_pattern)) {
        try {
            return ConfigValue(std::stoi(text));
        } catch (const std::out_of_range&) {
            return ConfigValue(text);
        }
    }
    if (std::regex_match(text, double_pattern)) {
        return ConfigValue(std::stod(text));
    }
    return ConfigValue(text);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsScalar()) {
        std::string text = node.as<std::string>();
        ConfigValue value = parseScalar(text);
        if (auto str = value.tryAs<std::string>()) {
            return ConfigValue(expandVariables(*str));
        }
        return value;
    }
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (node.IsNull()) {
        return ConfigValue();
    }
    throw std::runtime_error("Nested mappings are not supported inside a configuration section");
}

// EN: Walk the process environment and apply every PREFIX + SECTION__KEY variable.
// FR: Parcourt l'environnement du processus et applique chaque variable PREFIX + SECTION__CLE.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    size_t applied = 0;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string assignment(*entry);
        auto eq = assignment.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string name = assignment.substr(0, eq);
        if (name.rfind(prefix, 0) != 0) {
            continue;
        }

        std::string path = name.substr(prefix.size());
        auto separator = path.find("__");
        if (separator == std::string::npos || separator == 0 || separator + 2 >= path.size()) {
            continue;
        }

        std::string section = path.substr(0, separator);
        std::string key = path.substr(separator + 2);
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };

        set(lower(section), lower(key), parseScalar(assignment.substr(eq + 1)));
        LOG_DEBUG("config", "Environment override applied: " + lower(section) + "." + lower(key));
        ++applied;
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value = lookup(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::lookup(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup(section, key);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

int ConfigManager::getInt(const std::string& section, const std::string& key, int default_value) const {
    return get(section, key).asOrDefault<int>(default_value);
}

bool ConfigManager::getBool(const std::string& section, const std::string& key, bool default_value) const {
    return get(section, key).asOrDefault<bool>(default_value);
}

std::string ConfigManager::getString(const std::string& section, const std::string& key,
                                     const std::string& default_value) const {
    ConfigValue value = get(section, key);
    if (!value.isValid()) {
        return default_value;
    }
    // EN: Numbers and booleans are accepted where a string is expected (e.g. a toolchain named 1.75).
    // FR: Nombres et booléens acceptés là où une chaîne est attendue (ex. une toolchain nommée 1.75).
    return value.toString();
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

// EN: Expand ${VAR} references from the process environment; unknown variables are left as-is.
// FR: Étend les références ${VAR} depuis l'environnement du processus ; les variables inconnues restent telles quelles.
std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

// Explicit template instantiations for non-specialized methods only
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace CIP
