#include <gtest/gtest.h>
#include "projection/DirectoryProjector.hpp"
#include "projection/Error.hpp"
#include "ProjectionTree.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rw::projection;

using Names = std::vector<std::string>;

class DirectoryProjectorTest : public ::testing::Test {
protected:
    static constexpr Timestamp t0 = 100000;

    rw::test::ProjectionTree tree;

    [[nodiscard]] Names list(const Timestamp ts, const std::string& relDir = "") const {
        return listDirectory(ts, relDir, tree.layout());
    }

    static bool contains(const Names& names, const std::string& name) {
        return std::ranges::find(names, name) != names.end();
    }

    void liveAndTwoVersions(const std::string& relDir) {
        const auto prefix = relDir.empty() ? std::string{} : relDir + "/";
        tree.createFile(".sync/Archive/" + prefix + "f1", t0 - 100);
        tree.createFile(".sync/Archive/" + prefix + "f1.1", t0);
        tree.createFile(prefix + "f1", t0);

        for (const Timestamp ts : {t0 + 1, t0, t0 - 1, t0 - 100})
            EXPECT_EQ(list(ts, relDir), (Names{".", "..", "f1"})) << "at " << ts;
    }

    void noLiveTwoVersions(const std::string& relDir) {
        const auto prefix = relDir.empty() ? std::string{} : relDir + "/";
        tree.createFile(".sync/Archive/" + prefix + "f2", t0 - 100);
        tree.createFile(".sync/Archive/" + prefix + "f2.1", t0);

        for (const Timestamp ts : {t0, t0 + 1, t0 + 100})
            EXPECT_EQ(list(ts, relDir), (Names{".", ".."})) << "at " << ts;

        for (const Timestamp ts : {t0 - 1, t0 - 100, t0 - 200})
            EXPECT_EQ(list(ts, relDir), (Names{".", "..", "f2"})) << "at " << ts;
    }
};

TEST_F(DirectoryProjectorTest, LiveAndTwoVersions) {
    liveAndTwoVersions("");
}

TEST_F(DirectoryProjectorTest, NoLiveTwoVersions) {
    noLiveTwoVersions("");
}

TEST_F(DirectoryProjectorTest, NoLiveTwoVersionsSubdir) {
    noLiveTwoVersions("dir2");
}

TEST_F(DirectoryProjectorTest, LiveAndTwoVersionsSubdir) {
    liveAndTwoVersions("dir1");
}

TEST_F(DirectoryProjectorTest, CombinedScenario) {
    tree.createFile("f1", 100000);
    tree.createFile(".sync/Archive/f1", 99900);
    tree.createFile(".sync/Archive/f1.1", 100000);
    tree.createFile(".sync/Archive/f2", 99000);
    tree.createFile(".sync/Archive/f2.1", 99200);

    EXPECT_EQ(list(99199), (Names{".", "..", "f1", "f2"}));
    EXPECT_EQ(list(99200), (Names{".", "..", "f1"}));
    EXPECT_EQ(list(100500), (Names{".", "..", "f1"}));

    for (const Timestamp ts : {99900, 99950, 100000, 200000})
        EXPECT_TRUE(contains(list(ts), "f1")) << "at " << ts;
}

TEST_F(DirectoryProjectorTest, LiveFileNotYetCreated) {
    tree.createFile("late", 5000);
    EXPECT_EQ(list(4999), (Names{".", ".."}));
    EXPECT_EQ(list(5000), (Names{".", "..", "late"}));
}

TEST_F(DirectoryProjectorTest, MetadataDirHiddenOnlyAtRoot) {
    tree.createDir("dir/.sync");
    tree.createFile("dir/a", 10);

    EXPECT_EQ(list(100), (Names{".", "..", "dir"}));
    EXPECT_EQ(list(100, "dir"), (Names{".", "..", "a", ".sync"}));
}

TEST_F(DirectoryProjectorTest, DirectoriesListedAtEveryInstant) {
    tree.createDir("photos");
    tree.createDir(".sync/Archive/removed");

    for (const Timestamp ts : {Timestamp{0}, t0, Timestamp{4000000000}})
        EXPECT_EQ(list(ts), (Names{".", "..", "photos", "removed"})) << "at " << ts;
}

TEST_F(DirectoryProjectorTest, OtherEntriesListedWithDirectories) {
    tree.createFile("target", 10);
    fs::create_symlink("target", tree.root() / "link");

    EXPECT_EQ(list(5), (Names{".", "..", "link"}));
    EXPECT_EQ(list(10), (Names{".", "..", "target", "link"}));
}

TEST_F(DirectoryProjectorTest, FileAndDirectoryWithSameNameListedTwice) {
    tree.createDir("x");
    tree.createFile(".sync/Archive/x", 500);

    EXPECT_EQ(list(400), (Names{".", "..", "x", "x"}));
    EXPECT_EQ(list(600), (Names{".", "..", "x"}));
}

TEST_F(DirectoryProjectorTest, ArchivedDirectoryNamesAreNotDecoded) {
    tree.createDir(".sync/Archive/build.2");
    EXPECT_EQ(list(1), (Names{".", "..", "build.2"}));
}

TEST_F(DirectoryProjectorTest, LiveBoundarySnapsNewestArchive) {
    // archived copy stamped after the live file still only covers up to the live boundary
    tree.createFile("f1", 500);
    tree.createFile(".sync/Archive/f1", 700);

    EXPECT_EQ(list(499), (Names{".", "..", "f1"}));
    EXPECT_EQ(list(600), (Names{".", "..", "f1"}));
}

TEST_F(DirectoryProjectorTest, StatusChangeTimeSnapsArchive) {
    tree.createFile("f1", 500);
    tree.createFile(".sync/Archive/f1", 300);

    auto layout = tree.layout();
    layout.liveBoundary = BoundarySource::StatusChangeTime;

    // ctime is the moment of the test run, so the archived version now reaches up to it
    EXPECT_EQ(listDirectory(1000, "", layout), (Names{".", "..", "f1"}));
}

TEST_F(DirectoryProjectorTest, MissingDirectoriesContributeNothing) {
    EXPECT_EQ(list(t0, "nowhere"), (Names{".", ".."}));

    fs::remove_all(tree.root() / ".sync");
    tree.createFile("f", 1);
    EXPECT_EQ(list(t0), (Names{".", "..", "f"}));
}

TEST_F(DirectoryProjectorTest, MalformedDirectoryIsInvalid) {
    try {
        (void)list(t0, "dir/");
        FAIL() << "trailing separator accepted";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidPath);
    }
    EXPECT_THROW((void)list(t0, "/dir"), Error);
    EXPECT_THROW((void)list(t0, "a//b"), Error);
}

TEST_F(DirectoryProjectorTest, FilesSortedBeforeDirectories) {
    tree.createDir("aaa");
    tree.createFile("zzz", 1);
    tree.createFile("mmm", 1);
    tree.createFile(".sync/Archive/bbb.3", 50);

    EXPECT_EQ(list(10), (Names{".", "..", "bbb", "mmm", "zzz", "aaa"}));
}

TEST_F(DirectoryProjectorTest, RepeatedCallsAgree) {
    tree.createFile("f1", t0);
    tree.createFile(".sync/Archive/f1", t0 - 50);
    tree.createFile(".sync/Archive/f2.1", t0 - 10);
    tree.createDir("sub");

    for (const Timestamp ts : {t0 - 100, t0 - 50, t0 - 10, t0 - 1, t0, t0 + 1})
        EXPECT_EQ(list(ts), list(ts)) << "at " << ts;
}
