#pragma once
#include "Branch.hpp"
#include "Commit.hpp"
#include "Repository.hpp"
#include <ostream>
#include <string>

namespace render {

std::string formatTimestamp(vcs::Commit::Clock::time_point when);

void printCommit(std::ostream& out, const vcs::Commit& commit);
void printBranch(std::ostream& out, const vcs::Branch& branch);
void printRepository(std::ostream& out, const vcs::Repository& repo);

std::string toString(const vcs::Commit& commit);
std::string toString(const vcs::Branch& branch);

} // namespace render
