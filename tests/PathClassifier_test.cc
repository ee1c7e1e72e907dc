#include <limits.h>
#include <unistd.h>
#include <gtest/gtest.h>

#include "PathClassifier.h"
#include "testutil.h"


class PathClassifierTest : public ::testing::Test {
protected:
    TempDir tmp;
    LocalFilesystem fs;

    void SetUp() override {
        quietGlobals();
        ASSERT_FALSE(tmp.path().empty());

        mkdirp(tmp.path("home/alice"));
        mkdirp(tmp.path("data/clear/docs"));
        mkdirp(tmp.path("data2/stuff"));
        mkdirp(tmp.path("jail/share"));
        mkdirp(tmp.path("elsewhere"));
    }

    PathClassifier classifier() {
        return PathClassifier(fs, tmp.path("home/alice"), tmp.path("data"), tmp.path("jail"));
    }
};


TEST_F(PathClassifierTest, ProtectedRootsAreForbiddenExactly) {
    auto pc = classifier();

    EXPECT_EQ(pcForbiddenExact, pc.classify(tmp.path("home/alice")));
    EXPECT_EQ(pcForbiddenExact, pc.classify(tmp.path("data")));
    EXPECT_EQ(pcForbiddenExact, pc.classify(tmp.path("data/")));
}


TEST_F(PathClassifierTest, BelowAnAllowedRootIsAllowed) {
    auto pc = classifier();

    EXPECT_EQ(pcAllowed, pc.classify(tmp.path("data/clear")));
    EXPECT_EQ(pcAllowed, pc.classify(tmp.path("data/clear/docs")));
    EXPECT_EQ(pcAllowed, pc.classify(tmp.path("jail")));
    EXPECT_EQ(pcAllowed, pc.classify(tmp.path("jail/share")));
}


TEST_F(PathClassifierTest, OutsideEveryAllowedRootIsForbidden) {
    auto pc = classifier();

    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("elsewhere")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("home")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify("/"));
}


TEST_F(PathClassifierTest, PrefixesCompareByWholeComponents) {
    auto pc = classifier();

    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("data2/stuff")));
}


TEST_F(PathClassifierTest, RelativeAndDotDotFormsAreResolved) {
    auto pc = classifier();

    EXPECT_EQ(pcForbiddenExact, pc.classify(tmp.path("data/clear/..")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("jail/share/../../elsewhere")));

    char cwd[PATH_MAX + 1];
    ASSERT_NE((char *)NULL, getcwd(cwd, sizeof(cwd)));
    ASSERT_EQ(0, chdir(tmp.path("jail").c_str()));
    EXPECT_EQ(pcAllowed, pc.classify("share"));
    EXPECT_EQ(pcForbiddenExact, pc.classify("../data"));
    ASSERT_EQ(0, chdir(cwd));
}


TEST_F(PathClassifierTest, SymlinksCannotSmuggleAProtectedRootIn) {
    ASSERT_EQ(0, symlink(tmp.path("home/alice").c_str(), tmp.path("jail/innocent").c_str()));
    ASSERT_EQ(0, symlink(tmp.path("elsewhere").c_str(), tmp.path("data/clear/escape").c_str()));

    auto pc = classifier();

    EXPECT_EQ(pcForbiddenExact, pc.classify(tmp.path("jail/innocent")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("data/clear/escape")));
}


TEST_F(PathClassifierTest, UnresolvablePathsAreForbidden) {
    auto pc = classifier();

    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("jail/missing")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(""));
}


TEST_F(PathClassifierTest, NothingIsCachedBetweenCalls) {
    auto pc = classifier();
    string target = tmp.path("jail/later");

    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(target));

    ASSERT_EQ(0, symlink(tmp.path("home/alice").c_str(), target.c_str()));
    EXPECT_EQ(pcForbiddenExact, pc.classify(target));

    ASSERT_EQ(0, unlink(target.c_str()));
    mkdirp(target);
    EXPECT_EQ(pcAllowed, pc.classify(target));
}


TEST_F(PathClassifierTest, ABlankJailOnlyAllowsTheDataRoot) {
    PathClassifier pc(fs, tmp.path("home/alice"), tmp.path("data"), "");

    EXPECT_EQ(pcAllowed, pc.classify(tmp.path("data/clear")));
    EXPECT_EQ(pcForbiddenOutsideJail, pc.classify(tmp.path("jail/share")));
}


TEST(PathWithin, ComparesWholeComponents) {
    EXPECT_TRUE(pathWithin("/mnt/data", "/mnt/data"));
    EXPECT_TRUE(pathWithin("/mnt/data/x", "/mnt/data"));
    EXPECT_TRUE(pathWithin("/mnt/data/x", "/mnt/data/"));
    EXPECT_TRUE(pathWithin("/anything", "/"));
    EXPECT_FALSE(pathWithin("/mnt/data2", "/mnt/data"));
    EXPECT_FALSE(pathWithin("/mnt", "/mnt/data"));
    EXPECT_FALSE(pathWithin("/mnt/data", ""));
}
