#include "Commit.hpp"
#include "GitUtils.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace vcs {

namespace {

std::string canonicalText(const std::string& name,
                          const std::string& description,
                          Commit::Clock::time_point createdAt,
                          const std::vector<std::string>& files)
{
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        createdAt.time_since_epoch()).count();

    std::ostringstream out;
    out << "name " << name << "\n";
    out << "time " << nanos << "\n";
    for (const auto& f : files)
        out << "file " << f << "\n";
    out << "\n" << description << "\n";
    return out.str();
}

} // namespace

Commit::Commit(std::string name, std::string description, std::vector<std::string> files)
    : name_(std::move(name)),
      description_(std::move(description)),
      createdAt_(Clock::now()),
      files_(std::move(files)),
      oid_(git::hashObject(canonicalText(name_, description_, createdAt_, files_),
                           GIT_OBJECT_COMMIT))
{
}

std::string Commit::id() const {
    return git::oidToString(oid_);
}

std::string Commit::shortId() const {
    return git::shortOid(oid_);
}

bool Commit::touches(const std::string& path) const {
    return std::find(files_.begin(), files_.end(), path) != files_.end();
}

CommitPtr makeCommit(const std::string& name,
                     const std::string& description,
                     const std::vector<std::string>& files)
{
    return std::make_shared<const Commit>(name, description, files);
}

} // namespace vcs
