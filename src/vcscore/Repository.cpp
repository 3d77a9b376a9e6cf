#include "Repository.hpp"
#include <stdexcept>
#include <utility>

namespace vcs {

MemoryRepository::MemoryRepository(std::string name)
    : name_(std::move(name))
{
}

void MemoryRepository::createBranch(const std::string& newName,
                                    const std::string& baseName,
                                    const CommitPtr& lastCommit)
{
    std::shared_ptr<Branch> branch;
    if (!baseName.empty()) {
        auto base = branches_.find(baseName);
        if (base == branches_.end()) return;
        branch = base->second->clone(lastCommit);
        branch->setName(newName);
    } else {
        branch = std::make_shared<LinearBranch>(newName);
    }

    branches_[newName] = branch;
    log_.record({RepositoryOp::Kind::CreateBranch, newName, "", nullptr});
}

void MemoryRepository::removeBranch(const std::string& name) {
    if (branches_.erase(name) == 0) return;
    log_.record({RepositoryOp::Kind::RemoveBranch, name, "", nullptr});
}

void MemoryRepository::cloneBranch(const std::string& name,
                                   const std::string& newName,
                                   const CommitPtr& lastCommit)
{
    auto source = branches_.find(name);
    if (source == branches_.end()) return;

    auto cloned = source->second->clone(lastCommit);
    cloned->setName(newName);
    branches_[newName] = cloned;
    log_.record({RepositoryOp::Kind::CloneBranch, name, newName, nullptr});
}

void MemoryRepository::addBranch(const std::shared_ptr<Branch>& branch) {
    if (!branch)
        throw std::invalid_argument("Cannot add a null branch to repository " + name_);

    branches_[branch->getName()] = branch;
    log_.record({RepositoryOp::Kind::AddBranch, branch->getName(), "", branch});
}

std::vector<std::shared_ptr<Branch>> MemoryRepository::getBranchList() const {
    std::vector<std::shared_ptr<Branch>> list;
    list.reserve(branches_.size());
    for (const auto& entry : branches_)
        list.push_back(entry.second);
    return list;
}

std::shared_ptr<Branch> MemoryRepository::findBranch(const std::string& name) const {
    auto it = branches_.find(name);
    return it == branches_.end() ? nullptr : it->second;
}

// Removed and cloned branches are not kept in the log, so their undo and
// redo only erase by the recorded name. CreateBranch is dropped unreversed.
void MemoryRepository::undo() {
    auto op = log_.takeUndo();
    if (!op) return;

    switch (op->kind) {
        case RepositoryOp::Kind::CreateBranch:
            break;
        case RepositoryOp::Kind::RemoveBranch:
        case RepositoryOp::Kind::CloneBranch:
        case RepositoryOp::Kind::AddBranch:
            branches_.erase(op->name);
            log_.pushRedo(std::move(*op));
            break;
    }
}

void MemoryRepository::redo() {
    auto op = log_.takeRedo();
    if (!op) return;

    switch (op->kind) {
        case RepositoryOp::Kind::CreateBranch:
            break;
        case RepositoryOp::Kind::RemoveBranch:
            branches_.erase(op->name);
            log_.pushUndo(std::move(*op));
            break;
        case RepositoryOp::Kind::CloneBranch:
            log_.pushUndo(std::move(*op));
            break;
        case RepositoryOp::Kind::AddBranch:
            branches_[op->name] = op->branch;
            log_.pushUndo(std::move(*op));
            break;
    }
}

} // namespace vcs
