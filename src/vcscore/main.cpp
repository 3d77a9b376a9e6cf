#include "GitUtils.hpp"
#include "Repository.hpp"
#include "ScriptRunner.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2 && argc != 3) {
        std::cerr << "Usage: vcscore <repository-name> [script-file]\n";
        return 1;
    }

    std::string repoName = argv[1];

    try {
        git::init();
        vcs::MemoryRepository repo(repoName);
        cli::ScriptRunner runner(repo, std::cout, std::cerr);

        if (argc == 3) {
            std::ifstream script(argv[2]);
            if (!script)
                throw std::runtime_error(std::string("Failed to open script: ") + argv[2]);
            runner.run(script);
        } else {
            runner.run(std::cin);
        }

        git::shutdown();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        git::shutdown();
        return 1;
    }
    return 0;
}
