#include "HistoryPrinter.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace render {

std::string formatTimestamp(vcs::Commit::Clock::time_point when) {
    std::time_t t = vcs::Commit::Clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void printCommit(std::ostream& out, const vcs::Commit& commit) {
    out << commit.shortId()
        << " Commit: " << commit.name()
        << ", Description: " << commit.description()
        << ", Created at: " << formatTimestamp(commit.createdAt());
}

void printBranch(std::ostream& out, const vcs::Branch& branch) {
    out << "Branch: " << branch.getName() << "\n";
    for (const auto& commit : branch.getCommitsList()) {
        printCommit(out, *commit);
        out << "\n";
    }
}

void printRepository(std::ostream& out, const vcs::Repository& repo) {
    out << "Repository: " << repo.getName() << "\n";
    for (const auto& branch : repo.getBranchList())
        printBranch(out, *branch);
}

std::string toString(const vcs::Commit& commit) {
    std::ostringstream out;
    printCommit(out, commit);
    return out.str();
}

std::string toString(const vcs::Branch& branch) {
    std::ostringstream out;
    printBranch(out, branch);
    return out.str();
}

} // namespace render
