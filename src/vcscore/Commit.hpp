#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <git2.h>

namespace vcs {

// A named change touching a list of files. Immutable once constructed;
// branches share commits through CommitPtr.
class Commit {
public:
    using Clock = std::chrono::system_clock;

    Commit(std::string name, std::string description, std::vector<std::string> files);

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    Clock::time_point createdAt() const { return createdAt_; }
    const std::vector<std::string>& files() const { return files_; }

    // Content id over name, description, creation time and files
    const git_oid& oid() const { return oid_; }
    std::string id() const;
    std::string shortId() const;

    bool touches(const std::string& path) const;

private:
    std::string name_;
    std::string description_;
    Clock::time_point createdAt_;
    std::vector<std::string> files_;
    git_oid oid_;
};

using CommitPtr = std::shared_ptr<const Commit>;

CommitPtr makeCommit(const std::string& name,
                     const std::string& description,
                     const std::vector<std::string>& files);

} // namespace vcs
