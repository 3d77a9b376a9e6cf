#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace vcs {

// Undo and redo stacks of reversible operation records.
// Recording a new operation leaves the redo stack as it is.
template <typename Op>
class OperationLog {
public:
    void record(Op op) { undo_.push_back(std::move(op)); }

    std::optional<Op> takeUndo() { return take(undo_); }
    std::optional<Op> takeRedo() { return take(redo_); }

    void pushUndo(Op op) { undo_.push_back(std::move(op)); }
    void pushRedo(Op op) { redo_.push_back(std::move(op)); }

    size_t undoDepth() const { return undo_.size(); }
    size_t redoDepth() const { return redo_.size(); }

private:
    static std::optional<Op> take(std::vector<Op>& stack) {
        if (stack.empty()) return std::nullopt;
        Op op = std::move(stack.back());
        stack.pop_back();
        return op;
    }

    std::vector<Op> undo_;
    std::vector<Op> redo_;
};

} // namespace vcs
