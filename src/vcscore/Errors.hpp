#pragma once

#include <stdexcept>
#include <string>

namespace vcs {

// Thrown by join when both branches touch the same file path
class NotJoinableBranchesError : public std::runtime_error {
public:
    NotJoinableBranchesError(const std::string& source,
                             const std::string& destination,
                             const std::string& path)
        : std::runtime_error("Cannot join branch " + source + " into " + destination +
                             ": both touch " + path),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class CommitNotFoundError : public std::runtime_error {
public:
    explicit CommitNotFoundError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace vcs
