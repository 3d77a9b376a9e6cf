#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "vcscore/Repository.hpp"
#include "vcscore/ScriptRunner.hpp"

namespace cli::test {

TEST(TokenizeTest, SplitsWordsAndKeepsQuotedSpaces) {
    auto words = tokenize("commit main c1 \"first change\"   a.py b.py");
    EXPECT_EQ(words, (std::vector<std::string>{"commit", "main", "c1", "first change", "a.py", "b.py"}));
    EXPECT_TRUE(tokenize("   ").empty());
}

class ScriptRunnerTest : public ::testing::Test {
protected:
    void run(const std::string& script) {
        std::istringstream in(script);
        runner.run(in);
    }

    vcs::MemoryRepository repo{"project"};
    std::ostringstream out;
    std::ostringstream err;
    ScriptRunner runner{repo, out, err};
};

TEST_F(ScriptRunnerTest, BuildsBranchesAndCommits) {
    run("# setup\n"
        "create main\n"
        "\n"
        "commit main c1 \"first change\" a.py\n"
        "commit main c2 second b.py\n"
        "create feature main\n");

    auto feature = repo.findBranch("feature");
    ASSERT_NE(feature, nullptr);
    ASSERT_EQ(feature->getCommitsList().size(), 2u);
    EXPECT_EQ(feature->getCommitsList()[0]->description(), "first change");
    EXPECT_TRUE(err.str().empty());
    EXPECT_NE(out.str().find("Created branch feature from main"), std::string::npos);
}

TEST_F(ScriptRunnerTest, CreateAtCommitIdTruncates) {
    run("create main\n"
        "commit main c1 one a.py\n"
        "commit main c2 two b.py\n");
    std::string id = repo.findBranch("main")->getCommitsList()[0]->id();

    run("create old main " + id.substr(0, 12) + "\n"
        "clone main older " + id + "\n");
    EXPECT_EQ(repo.findBranch("old")->getCommitsList().size(), 1u);
    EXPECT_EQ(repo.findBranch("older")->getCommitsList().size(), 1u);
}

TEST_F(ScriptRunnerTest, JoinConflictIsReportedAndScriptContinues) {
    run("create a\n"
        "create b\n"
        "commit a a1 one x.py\n"
        "commit b b1 two x.py\n"
        "join a b\n"
        "commit b b2 three y.py\n");

    EXPECT_NE(err.str().find("line 5"), std::string::npos);
    EXPECT_NE(err.str().find("x.py"), std::string::npos);
    EXPECT_EQ(repo.findBranch("b")->getCommitsList().size(), 2u);
}

TEST_F(ScriptRunnerTest, JoinWithoutConflictCopiesCommits) {
    run("create a\n"
        "create b\n"
        "commit a a1 one a.py\n"
        "join a b\n");

    EXPECT_EQ(repo.findBranch("b")->getCommitsList().size(), 1u);
    EXPECT_NE(out.str().find("Joined 1 commit(s) from a into b"), std::string::npos);
}

TEST_F(ScriptRunnerTest, UnknownCommitIdIsReported) {
    run("create main\n"
        "commit main c1 one a.py\n"
        "clone main copy zzzz\n");
    EXPECT_EQ(repo.findBranch("copy"), nullptr);
    EXPECT_NE(err.str().find("line 3"), std::string::npos);
}

TEST_F(ScriptRunnerTest, UndoRedoOnBranchAndRepository) {
    run("create main\n"
        "commit main c1 one a.py\n"
        "undo main\n");
    EXPECT_TRUE(repo.findBranch("main")->getCommitsList().empty());

    run("redo main\n"
        "undo\n"
        "undo\n");
    EXPECT_EQ(repo.findBranch("main")->getCommitsList().size(), 1u);
    EXPECT_NE(out.str().find("note: nothing to undo in repository project"), std::string::npos);
}

TEST_F(ScriptRunnerTest, NoOpsPrintNotes) {
    run("remove ghost\n"
        "clone ghost copy\n"
        "create copy ghost\n");

    EXPECT_TRUE(repo.getBranchList().empty());
    EXPECT_NE(out.str().find("note: no branch ghost, nothing removed"), std::string::npos);
    EXPECT_NE(out.str().find("note: no branch ghost, nothing cloned"), std::string::npos);
    EXPECT_NE(out.str().find("note: no branch ghost, nothing created"), std::string::npos);
}

TEST_F(ScriptRunnerTest, ShowRendersBranch) {
    run("create main\n"
        "commit main c1 one a.py\n"
        "show main\n");
    EXPECT_NE(out.str().find("Branch: main\n"), std::string::npos);
    EXPECT_NE(out.str().find("Commit: c1, Description: one"), std::string::npos);
}

TEST_F(ScriptRunnerTest, MalformedCommandsThrow) {
    EXPECT_THROW(run("frobnicate\n"), ScriptError);
    EXPECT_THROW(run("create\n"), ScriptError);
    EXPECT_THROW(run("commit ghost c1 desc\n"), ScriptError);

    try {
        run("create main\nremove\n");
        FAIL() << "remove without a name should throw";
    } catch (const ScriptError& ex) {
        EXPECT_EQ(ex.line(), 2u);
    }
}

} // namespace cli::test
