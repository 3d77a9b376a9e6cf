#include "GitUtils.hpp"
#include <git2.h>
#include <stdexcept>
#include <string>

namespace git {

// ------------------- initialization -------------------

void init() {
    if (git_libgit2_init() < 0)
        throw std::runtime_error("Failed to initialize libgit2");
}

void shutdown() {
    git_libgit2_shutdown();
}

// ------------------- object ids -------------------

git_oid hashObject(const std::string& content, git_object_t type) {
    git_oid oid;
    if (git_odb_hash(&oid, content.data(), content.size(), type) < 0)
        throw std::runtime_error("Failed to hash object");
    return oid;
}

std::string oidToString(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

std::string shortOid(const git_oid& oid, size_t length) {
    if (length > GIT_OID_HEXSZ) length = GIT_OID_HEXSZ;
    return oidToString(oid).substr(0, length);
}

} // namespace git
