#pragma once

#include "Branch.hpp"
#include "Repository.hpp"
#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cli {

class ScriptError : public std::runtime_error {
public:
    ScriptError(size_t line, const std::string& what)
        : std::runtime_error("line " + std::to_string(line) + ": " + what),
          line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Split a command line on whitespace; "double quoted" words may hold spaces
std::vector<std::string> tokenize(const std::string& line);

// Drives a repository from a line-oriented command script
class ScriptRunner {
public:
    ScriptRunner(vcs::Repository& repo, std::ostream& out, std::ostream& err);

    // Commands that fail with a join conflict or an unknown commit are
    // reported on `err` and the script goes on. Malformed commands throw.
    void run(std::istream& in);

    void execute(const std::vector<std::string>& args);

private:
    vcs::Branch& requireBranch(const std::string& name);
    void requireArgs(const std::vector<std::string>& args, size_t min, size_t max,
                     const char* usage);
    void note(const std::string& message);

    void createCommand(const std::vector<std::string>& args);
    void removeCommand(const std::vector<std::string>& args);
    void cloneCommand(const std::vector<std::string>& args);
    void commitCommand(const std::vector<std::string>& args);
    void joinCommand(const std::vector<std::string>& args);
    void undoRedoCommand(const std::vector<std::string>& args, bool undo);
    void showCommand(const std::vector<std::string>& args);

    vcs::Repository& repo_;
    std::ostream& out_;
    std::ostream& err_;
    size_t line_ = 0;
};

} // namespace cli
