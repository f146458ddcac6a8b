// EN: cipctl entry point. Runs, validates or lists a pipeline declaration.
// FR: Point d'entrée de cipctl. Exécute, valide ou liste une déclaration de pipeline.

#include <iostream>

#include "infrastructure/cli/application.hpp"

int main(int argc, char* argv[]) {
    CIP::CLI::Application application(std::cout, std::cerr);
    return application.run(argc, argv);
}
