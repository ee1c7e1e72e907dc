#include <limits.h>
#include <unistd.h>
#include <gtest/gtest.h>

#include "util_generic.h"
#include "testutil.h"


static bool globMatches(string glob, string name) {
    Pcre matcher(globToRegex(glob));
    return matcher.search(name);
}


TEST(UtilGeneric, GlobsMatchWholeBasenames) {
    EXPECT_TRUE(globMatches("*.pem", "server.pem"));
    EXPECT_FALSE(globMatches("*.pem", "server.pem.bak"));
    EXPECT_FALSE(globMatches("*.pem", "serverXpem"));
    EXPECT_TRUE(globMatches("id_rsa*", "id_rsa"));
    EXPECT_TRUE(globMatches("id_rsa*", "id_rsa.pub"));
    EXPECT_FALSE(globMatches("id_rsa*", "my_id_rsa"));
    EXPECT_TRUE(globMatches("key?.asc", "key1.asc"));
    EXPECT_FALSE(globMatches("key?.asc", "key12.asc"));
    EXPECT_TRUE(globMatches("[abc]*.key", "b-host.key"));
    EXPECT_FALSE(globMatches("[!abc]*.key", "b-host.key"));
    EXPECT_TRUE(globMatches("[!abc]*.key", "d-host.key"));
    EXPECT_TRUE(globMatches("weird(1)+.txt", "weird(1)+.txt"));
    EXPECT_TRUE(globMatches("open[bracket", "open[bracket"));
}


TEST(UtilGeneric, ALeadingBracketInAClassIsAMember) {
    EXPECT_EQ("^[\\]a]x$", globToRegex("[]a]x"));
    EXPECT_TRUE(globMatches("[]a]x", "]x"));
    EXPECT_TRUE(globMatches("[]a]x", "ax"));
    EXPECT_FALSE(globMatches("[]a]x", "bx"));

    EXPECT_TRUE(globMatches("[!]x]y", "ay"));
    EXPECT_FALSE(globMatches("[!]x]y", "]y"));
    EXPECT_FALSE(globMatches("[!]x]y", "xy"));

    EXPECT_EQ("^\\[\\]$", globToRegex("[]"));
    EXPECT_TRUE(globMatches("[]", "[]"));
    EXPECT_TRUE(globMatches("key[!]", "key[!]"));
}


TEST(UtilGeneric, PathsBecomeNames) {
    EXPECT_EQ("mnt-data-archive", pathAsName("/mnt/data/archive"));
    EXPECT_EQ("mnt-data-my_archive", pathAsName("/mnt/data/my archive"));
    EXPECT_EQ("a-b", pathAsName("//a//b"));
}


TEST(UtilGeneric, PathSplitIgnoresTrailingSlashes) {
    auto split = pathSplit("/home/alice/");
    EXPECT_EQ("/home", split.dir);
    EXPECT_EQ("alice", split.file);

    split = pathSplit("/mnt/data/notes.txt");
    EXPECT_EQ("/mnt/data", split.dir);
    EXPECT_EQ("notes", split.file_base);
    EXPECT_EQ("txt", split.file_ext);

    EXPECT_EQ("/", pathSplit("/etc").dir);
    EXPECT_EQ("/", pathSplit("/").dir);
}


TEST(UtilGeneric, SlashConcatJoinsOnce) {
    EXPECT_EQ("/mnt/data/clear", slashConcat("/mnt/data/", "/clear"));
    EXPECT_EQ("/a/b/c", slashConcat("/a", "b", "c"));
}


TEST(UtilGeneric, QuotedWordsStayTogether) {
    EXPECT_EQ((vector<string>{".ssh", "My Keys", ".gnupg"}), string2vectorOnSpace(".ssh 'My Keys' .gnupg", true));
    EXPECT_EQ((vector<string>{"one"}), string2vectorOnSpace("  one  "));
    EXPECT_TRUE(string2vectorOnSpace("").empty());
}


TEST(UtilGeneric, Md5OfKnownStrings) {
    EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", MD5string(""));
    EXPECT_EQ("900150983cd24fb0d6963f7d28e17f72", MD5string("abc"));
}


TEST(UtilGeneric, SmallHelpers) {
    EXPECT_EQ("1 file", plural(1, "file"));
    EXPECT_EQ("3 files", plural(3, "file"));
    EXPECT_EQ("a, b", perlJoin(", ", {"a", "b"}));
    EXPECT_EQ("01:01:01", seconds2hms(3661));
    EXPECT_EQ("x", trimSpace("  x \t"));
    EXPECT_TRUE(str2bool("yes"));
    EXPECT_TRUE(str2bool(""));
    EXPECT_FALSE(str2bool("no"));

    string text = "{home}/{home}";
    strReplaceAll(text, "{home}", "/root");
    EXPECT_EQ("/root//root", text);
}


TEST(UtilGeneric, MkdirpBuildsEveryLevel) {
    TempDir tmp;
    string deep = tmp.path("a/b/c");

    EXPECT_EQ(0, mkdirp(deep));
    EXPECT_TRUE(isDirectory(deep));
    EXPECT_EQ(0, mkdirp(deep));
}


TEST(UtilGeneric, MkdirpKeepsRelativePathsRelative) {
    TempDir tmp;
    char cwd[PATH_MAX];

    ASSERT_NE((char *)NULL, getcwd(cwd, sizeof(cwd)));
    ASSERT_EQ(0, chdir(tmp.path().c_str()));

    int rc = mkdirp("vaultsync_relative/staging");
    bool created = isDirectory(tmp.path("vaultsync_relative/staging"));
    bool rooted = exists("/vaultsync_relative");

    ASSERT_EQ(0, chdir(cwd));
    EXPECT_EQ(0, rc);
    EXPECT_TRUE(created);
    EXPECT_FALSE(rooted);
}
