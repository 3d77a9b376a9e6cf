#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "vcscore/Commit.hpp"
#include "vcscore/GitUtils.hpp"

namespace vcs::test {

TEST(CommitTest, ExposesConstructionFields) {
    std::vector<std::string> files{"src/a.cpp", "src/a.hpp", "src/a.cpp"};
    auto before = Commit::Clock::now();
    Commit commit("c1", "first change", files);
    auto after = Commit::Clock::now();

    EXPECT_EQ(commit.name(), "c1");
    EXPECT_EQ(commit.description(), "first change");
    EXPECT_EQ(commit.files(), files);
    EXPECT_GE(commit.createdAt(), before);
    EXPECT_LE(commit.createdAt(), after);
}

TEST(CommitTest, IdIsFortyHexCharacters) {
    Commit commit("c1", "desc", {"a.py"});
    std::string id = commit.id();

    ASSERT_EQ(id.size(), 40u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(commit.shortId(), id.substr(0, 7));
}

TEST(CommitTest, IdMatchesOid) {
    Commit commit("c1", "desc", {});
    EXPECT_EQ(commit.id(), git::oidToString(commit.oid()));
}

TEST(CommitTest, TouchesOnlyListedPaths) {
    Commit commit("c1", "desc", {"a.py", "dir/b.py"});

    EXPECT_TRUE(commit.touches("a.py"));
    EXPECT_TRUE(commit.touches("dir/b.py"));
    EXPECT_FALSE(commit.touches("b.py"));
    EXPECT_FALSE(commit.touches(""));
}

TEST(CommitTest, EmptyFileListTouchesNothing) {
    Commit commit("empty", "", {});
    EXPECT_TRUE(commit.files().empty());
    EXPECT_FALSE(commit.touches("a.py"));
}

TEST(GitUtilsTest, HashObjectMatchesGitBlobId) {
    // `git hash-object` of an empty file
    git_oid oid = git::hashObject("", GIT_OBJECT_BLOB);
    EXPECT_EQ(git::oidToString(oid), "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    EXPECT_EQ(git::shortOid(oid), "e69de29");
    EXPECT_EQ(git::shortOid(oid, 100).size(), 40u);
}

} // namespace vcs::test
