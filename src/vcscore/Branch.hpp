#pragma once

#include "Commit.hpp"
#include "OperationLog.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace vcs {

class Branch {
public:
    virtual ~Branch() = default;

    // Copy of this branch's history, truncated after lastCommit when given.
    // Throws CommitNotFoundError if lastCommit is not on this branch.
    virtual std::shared_ptr<Branch> clone(const CommitPtr& lastCommit = nullptr) const = 0;

    virtual void addCommit(const std::string& name,
                           const std::string& description,
                           const std::vector<std::string>& files) = 0;

    // Re-create every commit of this branch in destination, oldest first.
    // Throws NotJoinableBranchesError without touching destination if any
    // file path is touched on both branches.
    virtual void join(Branch& destination) const = 0;

    virtual void undo() = 0;
    virtual void redo() = 0;

    virtual const std::vector<CommitPtr>& getCommitsList() const = 0;
    virtual const std::string& getName() const = 0;
    virtual void setName(const std::string& name) = 0;

    virtual size_t undoDepth() const = 0;
    virtual size_t redoDepth() const = 0;
};

struct BranchOp {
    enum class Kind { AddCommit };
    Kind kind;
    CommitPtr commit;
};

class LinearBranch : public Branch {
public:
    explicit LinearBranch(std::string name);

    std::shared_ptr<Branch> clone(const CommitPtr& lastCommit = nullptr) const override;
    void addCommit(const std::string& name,
                   const std::string& description,
                   const std::vector<std::string>& files) override;
    void join(Branch& destination) const override;
    void undo() override;
    void redo() override;

    const std::vector<CommitPtr>& getCommitsList() const override { return commits_; }
    const std::string& getName() const override { return name_; }
    void setName(const std::string& name) override { name_ = name; }

    size_t undoDepth() const override { return log_.undoDepth(); }
    size_t redoDepth() const override { return log_.redoDepth(); }

private:
    std::string name_;
    std::vector<CommitPtr> commits_;
    OperationLog<BranchOp> log_;
};

// Unique commit of `branch` whose id starts with `prefix`
CommitPtr findCommit(const Branch& branch, const std::string& prefix);

} // namespace vcs
