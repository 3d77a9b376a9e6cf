#include "Branch.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <utility>

namespace vcs {

LinearBranch::LinearBranch(std::string name)
    : name_(std::move(name))
{
}

std::shared_ptr<Branch> LinearBranch::clone(const CommitPtr& lastCommit) const {
    auto cloned = std::make_shared<LinearBranch>(name_);
    if (!lastCommit) {
        cloned->commits_ = commits_;
        return cloned;
    }

    auto it = std::find(commits_.begin(), commits_.end(), lastCommit);
    if (it == commits_.end())
        throw CommitNotFoundError("Commit " + lastCommit->shortId() +
                                  " is not on branch " + name_);
    cloned->commits_.assign(commits_.begin(), it + 1);
    return cloned;
}

void LinearBranch::addCommit(const std::string& name,
                             const std::string& description,
                             const std::vector<std::string>& files)
{
    CommitPtr commit = makeCommit(name, description, files);
    commits_.push_back(commit);
    log_.record({BranchOp::Kind::AddCommit, commit});
}

void LinearBranch::join(Branch& destination) const {
    // Snapshot first: destination may be this branch
    const std::vector<CommitPtr> source = commits_;
    const auto& target = destination.getCommitsList();

    for (const auto& ours : source) {
        for (const auto& path : ours->files()) {
            for (const auto& theirs : target) {
                if (theirs->touches(path))
                    throw NotJoinableBranchesError(name_, destination.getName(), path);
            }
        }
    }

    for (const auto& commit : source)
        destination.addCommit(commit->name(), commit->description(), commit->files());
}

void LinearBranch::undo() {
    auto op = log_.takeUndo();
    if (!op) return;

    switch (op->kind) {
        case BranchOp::Kind::AddCommit: {
            auto it = std::find(commits_.begin(), commits_.end(), op->commit);
            if (it != commits_.end()) commits_.erase(it);
            log_.pushRedo(std::move(*op));
            break;
        }
    }
}

void LinearBranch::redo() {
    auto op = log_.takeRedo();
    if (!op) return;

    switch (op->kind) {
        case BranchOp::Kind::AddCommit:
            commits_.push_back(op->commit);
            log_.pushUndo(std::move(*op));
            break;
    }
}

CommitPtr findCommit(const Branch& branch, const std::string& prefix) {
    if (prefix.empty())
        throw CommitNotFoundError("Empty commit id");

    CommitPtr found;
    for (const auto& commit : branch.getCommitsList()) {
        if (commit->id().compare(0, prefix.size(), prefix) != 0) continue;
        if (found && found != commit)
            throw CommitNotFoundError("Ambiguous commit id " + prefix +
                                      " on branch " + branch.getName());
        found = commit;
    }
    if (!found)
        throw CommitNotFoundError("No commit " + prefix + " on branch " + branch.getName());
    return found;
}

} // namespace vcs
