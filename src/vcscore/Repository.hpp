#pragma once

#include "Branch.hpp"
#include "Commit.hpp"
#include "OperationLog.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vcs {

class Repository {
public:
    virtual ~Repository() = default;

    // Empty baseName creates an empty branch; otherwise clones baseName
    // (truncated after lastCommit when given). Unknown baseName is a no-op.
    virtual void createBranch(const std::string& newName,
                              const std::string& baseName = "",
                              const CommitPtr& lastCommit = nullptr) = 0;
    virtual void removeBranch(const std::string& name) = 0;
    virtual void cloneBranch(const std::string& name,
                             const std::string& newName,
                             const CommitPtr& lastCommit = nullptr) = 0;
    virtual void addBranch(const std::shared_ptr<Branch>& branch) = 0;

    virtual std::vector<std::shared_ptr<Branch>> getBranchList() const = 0;
    virtual std::shared_ptr<Branch> findBranch(const std::string& name) const = 0;
    virtual const std::string& getName() const = 0;

    virtual void undo() = 0;
    virtual void redo() = 0;

    virtual size_t undoDepth() const = 0;
    virtual size_t redoDepth() const = 0;
};

struct RepositoryOp {
    enum class Kind { CreateBranch, RemoveBranch, CloneBranch, AddBranch };
    Kind kind;
    std::string name;                // source branch for CloneBranch
    std::string newName;             // CloneBranch only
    std::shared_ptr<Branch> branch;  // AddBranch only
};

class MemoryRepository : public Repository {
public:
    explicit MemoryRepository(std::string name);

    void createBranch(const std::string& newName,
                      const std::string& baseName = "",
                      const CommitPtr& lastCommit = nullptr) override;
    void removeBranch(const std::string& name) override;
    void cloneBranch(const std::string& name,
                     const std::string& newName,
                     const CommitPtr& lastCommit = nullptr) override;
    void addBranch(const std::shared_ptr<Branch>& branch) override;

    std::vector<std::shared_ptr<Branch>> getBranchList() const override;
    std::shared_ptr<Branch> findBranch(const std::string& name) const override;
    const std::string& getName() const override { return name_; }

    void undo() override;
    void redo() override;

    size_t undoDepth() const override { return log_.undoDepth(); }
    size_t redoDepth() const override { return log_.redoDepth(); }

private:
    std::string name_;
    std::map<std::string, std::shared_ptr<Branch>> branches_;
    OperationLog<RepositoryOp> log_;
};

} // namespace vcs
