#include "ScriptRunner.hpp"
#include "Errors.hpp"
#include "HistoryPrinter.hpp"
#include <iomanip>
#include <sstream>

namespace cli {

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream in(line);
    std::string word;
    while (in >> std::quoted(word))
        words.push_back(word);
    return words;
}

ScriptRunner::ScriptRunner(vcs::Repository& repo, std::ostream& out, std::ostream& err)
    : repo_(repo), out_(out), err_(err)
{
}

void ScriptRunner::run(std::istream& in) {
    std::string line;
    line_ = 0;
    while (std::getline(in, line)) {
        ++line_;
        auto args = tokenize(line);
        if (args.empty() || args[0][0] == '#') continue;

        try {
            execute(args);
        } catch (const vcs::NotJoinableBranchesError& ex) {
            err_ << "Error: line " << line_ << ": " << ex.what() << "\n";
        } catch (const vcs::CommitNotFoundError& ex) {
            err_ << "Error: line " << line_ << ": " << ex.what() << "\n";
        }
    }
}

void ScriptRunner::execute(const std::vector<std::string>& args) {
    if (args.empty())
        throw ScriptError(line_, "empty command");

    const std::string& cmd = args[0];
    if (cmd == "create")      createCommand(args);
    else if (cmd == "remove") removeCommand(args);
    else if (cmd == "clone")  cloneCommand(args);
    else if (cmd == "commit") commitCommand(args);
    else if (cmd == "join")   joinCommand(args);
    else if (cmd == "undo")   undoRedoCommand(args, true);
    else if (cmd == "redo")   undoRedoCommand(args, false);
    else if (cmd == "show")   showCommand(args);
    else throw ScriptError(line_, "unknown command: " + cmd);
}

// ------------------- helpers -------------------

vcs::Branch& ScriptRunner::requireBranch(const std::string& name) {
    auto branch = repo_.findBranch(name);
    if (!branch)
        throw ScriptError(line_, "unknown branch: " + name);
    return *branch;
}

void ScriptRunner::requireArgs(const std::vector<std::string>& args, size_t min, size_t max,
                               const char* usage)
{
    size_t n = args.size() - 1;
    if (n < min || n > max)
        throw ScriptError(line_, std::string("usage: ") + usage);
}

void ScriptRunner::note(const std::string& message) {
    out_ << "note: " << message << "\n";
}

// ------------------- repository commands -------------------

void ScriptRunner::createCommand(const std::vector<std::string>& args) {
    requireArgs(args, 1, 3, "create <new> [<base> [<commit-id>]]");
    const std::string& newName = args[1];
    if (args.size() == 2) {
        repo_.createBranch(newName);
        out_ << "Created branch " << newName << "\n";
        return;
    }

    const std::string& baseName = args[2];
    auto base = repo_.findBranch(baseName);
    if (!base) {
        note("no branch " + baseName + ", nothing created");
        return;
    }

    vcs::CommitPtr last;
    if (args.size() == 4) last = vcs::findCommit(*base, args[3]);
    repo_.createBranch(newName, baseName, last);
    out_ << "Created branch " << newName << " from " << baseName << "\n";
}

void ScriptRunner::removeCommand(const std::vector<std::string>& args) {
    requireArgs(args, 1, 1, "remove <name>");
    if (!repo_.findBranch(args[1])) {
        note("no branch " + args[1] + ", nothing removed");
        return;
    }
    repo_.removeBranch(args[1]);
    out_ << "Removed branch " << args[1] << "\n";
}

void ScriptRunner::cloneCommand(const std::vector<std::string>& args) {
    requireArgs(args, 2, 3, "clone <name> <new> [<commit-id>]");
    auto source = repo_.findBranch(args[1]);
    if (!source) {
        note("no branch " + args[1] + ", nothing cloned");
        return;
    }

    vcs::CommitPtr last;
    if (args.size() == 4) last = vcs::findCommit(*source, args[3]);
    repo_.cloneBranch(args[1], args[2], last);
    out_ << "Cloned branch " << args[1] << " as " << args[2] << "\n";
}

// ------------------- branch commands -------------------

void ScriptRunner::commitCommand(const std::vector<std::string>& args) {
    if (args.size() < 4)
        throw ScriptError(line_, "usage: commit <branch> <name> <description> [files...]");

    vcs::Branch& branch = requireBranch(args[1]);
    std::vector<std::string> files(args.begin() + 4, args.end());
    branch.addCommit(args[2], args[3], files);
    out_ << "[" << branch.getName() << " " << branch.getCommitsList().back()->shortId()
         << "] " << args[2] << "\n";
}

void ScriptRunner::joinCommand(const std::vector<std::string>& args) {
    requireArgs(args, 2, 2, "join <source> <destination>");
    vcs::Branch& source = requireBranch(args[1]);
    vcs::Branch& destination = requireBranch(args[2]);
    source.join(destination);
    out_ << "Joined " << source.getCommitsList().size() << " commit(s) from "
         << source.getName() << " into " << destination.getName() << "\n";
}

void ScriptRunner::undoRedoCommand(const std::vector<std::string>& args, bool undo) {
    requireArgs(args, 0, 1, undo ? "undo [<branch>]" : "redo [<branch>]");
    const char* verb = undo ? "undo" : "redo";

    if (args.size() == 1) {
        if ((undo ? repo_.undoDepth() : repo_.redoDepth()) == 0) {
            note(std::string("nothing to ") + verb + " in repository " + repo_.getName());
            return;
        }
        undo ? repo_.undo() : repo_.redo();
        return;
    }

    vcs::Branch& branch = requireBranch(args[1]);
    if ((undo ? branch.undoDepth() : branch.redoDepth()) == 0) {
        note(std::string("nothing to ") + verb + " on branch " + branch.getName());
        return;
    }
    undo ? branch.undo() : branch.redo();
}

void ScriptRunner::showCommand(const std::vector<std::string>& args) {
    requireArgs(args, 0, 1, "show [<branch>]");
    if (args.size() == 1)
        render::printRepository(out_, repo_);
    else
        render::printBranch(out_, requireBranch(args[1]));
}

} // namespace cli
