#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include "core/errors.hpp"
#include "core/pipeline_types.hpp"

namespace CIP {
namespace Declaration {

// EN: Reads and writes YAML pipeline declarations (pipeline -> on -> env -> jobs -> steps).
//     Parsing then serialising keeps job order, step order and every parameter.
//     All structural problems raise DeclarationError with the offending line when known.
// FR: Lit et écrit les déclarations YAML de pipeline (pipeline -> on -> env -> jobs -> steps).
//     Parser puis sérialiser conserve l'ordre des jobs, des étapes et tous les paramètres.
//     Tout problème structurel lève DeclarationError avec la ligne fautive si connue.
class DeclarationParser {
public:
    static Pipeline parseFile(const std::string& path);
    static Pipeline parseString(const std::string& content);

    static std::string serialize(const Pipeline& pipeline);
    static void saveToFile(const std::string& path, const Pipeline& pipeline);

    // EN: Job identifiers: letters, digits, '_' and '-'
    // FR: Identifiants de job : lettres, chiffres, '_' et '-'
    static bool isValidJobId(const std::string& job_id);

private:
    static Pipeline parseRoot(const YAML::Node& root);
    static std::vector<EventKind> parseTriggers(const YAML::Node& node);
    static Job parseJob(const std::string& job_id, const YAML::Node& node);
    static Step parseStep(const std::string& job_id, size_t index, const YAML::Node& node);
    static CacheSpec parseCache(const std::string& job_id, const YAML::Node& node);
    static Parameters parseMapping(const YAML::Node& node, const std::string& context);

    static void emitParameters(YAML::Emitter& out, const Parameters& parameters);
    static void emitJob(YAML::Emitter& out, const Job& job);
    static void emitStep(YAML::Emitter& out, const Step& step);
};

} // namespace Declaration
} // namespace CIP
