#pragma once

#include <cstddef>
#include <string>

#include <git2.h>

namespace git {

// ------------------- initialization -------------------
void init();
void shutdown();

// ------------------- object ids -------------------
// Hash `content` the way git hashes a loose object of the given type
git_oid hashObject(const std::string& content, git_object_t type);

std::string oidToString(const git_oid& oid);
std::string shortOid(const git_oid& oid, size_t length = 7);

} // namespace git
