#include <gtest/gtest.h>

#include "pack/install_tracker.hpp"
#include "testing.hpp"

#include <filesystem>

namespace packsmith {
namespace {

namespace fs = std::filesystem;

class InstallTrackerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto res = InstallTracker::Open(tmp.Path(), ".packsmith", tracker);
        ASSERT_TRUE(res.is_ok()) << res.msg;
    }

    std::string At(const std::string& rel) const { return tmp.Path() + "/" + rel; }

    void Put(const std::string& rel, const std::string& content) {
        ASSERT_TRUE(testutil::WriteTextFile(At(rel), content));
    }

    InstallTracker Reopen() {
        InstallTracker t;
        auto res = InstallTracker::Open(tmp.Path(), ".packsmith", t);
        EXPECT_TRUE(res.is_ok()) << res.msg;
        return t;
    }

    testutil::TemporaryDirectory tmp;
    InstallTracker tracker;
};

TEST_F(InstallTrackerTest, RecordInstallPersistsEntry) {
    Put("switch/app/app.nro", "app");

    auto res = tracker.RecordInstall("app", {"switch/app/app.nro", "/switch/app/app.nro"}, "v1.0", "App");
    ASSERT_TRUE(res.is_ok()) << res.msg;

    InstallTracker again = Reopen();
    const InstalledEntry* e = again.FindInstalled("app");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->version, "v1.0");
    EXPECT_EQ(e->name, "App");
    EXPECT_FALSE(e->installed_at.empty());
    EXPECT_EQ(e->owned_paths, (std::vector<std::string>{"switch/app/app.nro"}));
}

TEST_F(InstallTrackerTest, ReinstallRemovesFilesNoLongerOwned) {
    Put("a.txt", "a");
    Put("dir/b.txt", "b");
    Put("old/only/stale.txt", "stale");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt", "dir/b.txt", "old/only/stale.txt"}).is_ok());

    Put("c.txt", "c");
    auto res = tracker.RecordInstall("comp", {"dir/b.txt", "c.txt"});
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_FALSE(testutil::Exists(At("a.txt")));
    EXPECT_FALSE(testutil::Exists(At("old/only/stale.txt")));
    EXPECT_FALSE(testutil::Exists(At("old")));
    EXPECT_TRUE(testutil::Exists(At("dir/b.txt")));
    EXPECT_TRUE(testutil::Exists(At("c.txt")));
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{"dir/b.txt", "c.txt"}));
}

TEST_F(InstallTrackerTest, RejectsPathsInsideStateDirectory) {
    auto res = tracker.RecordInstall("comp", {".packsmith/installed.json"});
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::UnsafeArchivePath);

    res = tracker.RecordInstall("comp", {"../outside.txt"});
    EXPECT_EQ(res.kind, ErrorKind::UnsafeArchivePath);
    EXPECT_EQ(tracker.FindInstalled("comp"), nullptr);
}

TEST_F(InstallTrackerTest, TrashThenRestoreIsByteIdentical) {
    Put("switch/app/app.nro", std::string("NRO\0\x01", 5) + "binary");
    Put("config/app/settings.ini", "[app]\nx=1\n");
    ASSERT_TRUE(tracker.RecordInstall("app", {"switch/app/app.nro", "config/app/settings.ini"}, "v2", "App").is_ok());
    const InstalledEntry before = *tracker.FindInstalled("app");

    auto trashed = tracker.MoveToTrash({"app"});
    ASSERT_EQ(trashed.size(), 1u);
    ASSERT_TRUE(trashed[0].result.is_ok()) << trashed[0].result.msg;
    EXPECT_EQ(trashed[0].moved, 2u);
    EXPECT_FALSE(testutil::Exists(At("switch/app/app.nro")));
    EXPECT_FALSE(testutil::Exists(At("switch")));
    EXPECT_EQ(tracker.FindInstalled("app"), nullptr);
    EXPECT_EQ(tracker.ListTrashed().size(), 2u);
    ASSERT_EQ(tracker.ListSnapshots().size(), 1u);

    InstallTracker reopened = Reopen();
    auto restored = reopened.Restore({"app"});
    ASSERT_EQ(restored.size(), 1u);
    ASSERT_TRUE(restored[0].result.is_ok()) << restored[0].result.msg;
    EXPECT_EQ(restored[0].moved, 2u);

    EXPECT_EQ(testutil::ReadFile(At("switch/app/app.nro")), std::string("NRO\0\x01", 5) + "binary");
    EXPECT_EQ(testutil::ReadFile(At("config/app/settings.ini")), "[app]\nx=1\n");

    const InstalledEntry* after = reopened.FindInstalled("app");
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->component_id, before.component_id);
    EXPECT_EQ(after->installed_at, before.installed_at);
    EXPECT_EQ(after->version, before.version);
    EXPECT_EQ(after->name, before.name);
    EXPECT_EQ(after->owned_paths, before.owned_paths);
    EXPECT_TRUE(reopened.ListTrashed().empty());
    EXPECT_TRUE(reopened.ListSnapshots().empty());
    EXPECT_FALSE(testutil::Exists(At(".packsmith/trash/app")));
}

TEST_F(InstallTrackerTest, RestoreTwiceIsHarmless) {
    Put("a.txt", "a");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt"}).is_ok());
    ASSERT_TRUE(tracker.MoveToTrash({"comp"})[0].result.is_ok());
    ASSERT_TRUE(tracker.Restore({"comp"})[0].result.is_ok());

    auto again = tracker.Restore({"comp"});
    ASSERT_TRUE(again[0].result.is_ok()) << again[0].result.msg;
    EXPECT_EQ(again[0].moved, 0u);
    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "a");
    ASSERT_NE(tracker.FindInstalled("comp"), nullptr);
}

TEST_F(InstallTrackerTest, RestoreConflictKeepsTrashedCopy) {
    Put("a.txt", "original");
    Put("b.txt", "b");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt", "b.txt"}).is_ok());
    ASSERT_TRUE(tracker.MoveToTrash({"comp"})[0].result.is_ok());

    Put("a.txt", "someone else");
    auto restored = tracker.Restore({"comp"});
    ASSERT_FALSE(restored[0].result.is_ok());
    EXPECT_EQ(restored[0].result.kind, ErrorKind::RestoreConflict);
    EXPECT_EQ(restored[0].conflicts, (std::vector<std::string>{"a.txt"}));

    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "someone else");
    EXPECT_EQ(testutil::ReadFile(At("b.txt")), "b");
    EXPECT_EQ(tracker.FindInstalled("comp"), nullptr);
    ASSERT_EQ(tracker.ListTrashed().size(), 1u);
    EXPECT_EQ(tracker.ListTrashed()[0].original_relative_path, "a.txt");

    fs::remove(At("a.txt"));
    auto second = tracker.Restore({"comp"});
    ASSERT_TRUE(second[0].result.is_ok()) << second[0].result.msg;
    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "original");
    ASSERT_NE(tracker.FindInstalled("comp"), nullptr);
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(InstallTrackerTest, TrashRecordsAlreadyMissingFiles) {
    Put("a.txt", "a");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt", "gone.txt"}).is_ok());

    auto trashed = tracker.MoveToTrash({"comp"});
    ASSERT_TRUE(trashed[0].result.is_ok()) << trashed[0].result.msg;
    EXPECT_EQ(trashed[0].moved, 1u);
    EXPECT_FALSE(trashed[0].warnings.empty());

    auto restored = tracker.Restore({"comp"});
    ASSERT_TRUE(restored[0].result.is_ok()) << restored[0].result.msg;
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{"a.txt"}));
}

TEST_F(InstallTrackerTest, RetriedTrashKeepsFilesMovedByInterruptedAttempt) {
    // A path that fits below the root but not below the trash folder, so the
    // first move of it fails with ENAMETOOLONG.
    std::string deep;
    for (int i = 0; i < 20; ++i) deep += std::string(199, 'd') + "/";
    deep += std::string(4070 - tmp.Path().size() - 1 - deep.size(), 'f');
    Put("a.txt", "kept across retries");
    Put(deep, "deep");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt", deep}).is_ok());

    auto first = tracker.MoveToTrash({"comp"});
    ASSERT_FALSE(first[0].result.is_ok());
    EXPECT_EQ(first[0].moved, 1u);
    ASSERT_NE(tracker.FindInstalled("comp"), nullptr);
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{deep}));

    std::error_code ec;
    fs::remove(At(deep), ec);
    ASSERT_FALSE(ec);

    auto second = tracker.MoveToTrash({"comp"});
    ASSERT_TRUE(second[0].result.is_ok()) << second[0].result.msg;
    EXPECT_EQ(tracker.FindInstalled("comp"), nullptr);
    EXPECT_EQ(tracker.ListSnapshots().size(), 1u);

    auto restored = tracker.Restore({"comp"});
    ASSERT_TRUE(restored[0].result.is_ok()) << restored[0].result.msg;
    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "kept across retries");
    ASSERT_NE(tracker.FindInstalled("comp"), nullptr);
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{"a.txt"}));
}

TEST_F(InstallTrackerTest, TrashRefusesToOverwriteEarlierTrashedCopy) {
    Put("a.txt", "first");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt"}).is_ok());
    ASSERT_TRUE(tracker.MoveToTrash({"comp"})[0].result.is_ok());

    Put("a.txt", "second");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt"}).is_ok());
    auto again = tracker.MoveToTrash({"comp"});
    EXPECT_EQ(again[0].result.kind, ErrorKind::RestoreConflict);
    EXPECT_EQ(again[0].moved, 0u);

    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "second");
    ASSERT_EQ(tracker.ListTrashed().size(), 1u);
    EXPECT_EQ(testutil::ReadFile(At(tracker.ListTrashed()[0].trash_relative_path)), "first");
}

TEST_F(InstallTrackerTest, TrashAfterReinstallJoinsExistingGeneration) {
    Put("a.txt", "a");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt"}).is_ok());
    ASSERT_TRUE(tracker.MoveToTrash({"comp"})[0].result.is_ok());

    Put("b.txt", "b");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"b.txt"}).is_ok());
    auto again = tracker.MoveToTrash({"comp"});
    ASSERT_TRUE(again[0].result.is_ok()) << again[0].result.msg;
    EXPECT_EQ(tracker.ListTrashed().size(), 2u);
    EXPECT_EQ(tracker.ListTrashed()[0].generation, tracker.ListTrashed()[1].generation);

    auto restored = tracker.Restore({"comp"});
    ASSERT_TRUE(restored[0].result.is_ok()) << restored[0].result.msg;
    EXPECT_EQ(testutil::ReadFile(At("a.txt")), "a");
    EXPECT_EQ(testutil::ReadFile(At("b.txt")), "b");
    EXPECT_EQ(tracker.FindInstalled("comp")->owned_paths, (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(InstallTrackerTest, PurgeDeletesTrashedFiles) {
    Put("a.txt", "a");
    ASSERT_TRUE(tracker.RecordInstall("comp", {"a.txt"}).is_ok());
    ASSERT_TRUE(tracker.MoveToTrash({"comp"})[0].result.is_ok());

    auto purged = tracker.Purge({"comp"});
    ASSERT_TRUE(purged[0].result.is_ok()) << purged[0].result.msg;
    EXPECT_TRUE(tracker.ListTrashed().empty());
    EXPECT_FALSE(testutil::Exists(At(".packsmith/trash/comp")));

    auto restored = tracker.Restore({"comp"});
    EXPECT_EQ(restored[0].result.kind, ErrorKind::NotFound);
    EXPECT_FALSE(testutil::Exists(At("a.txt")));
}

TEST_F(InstallTrackerTest, UnknownIdsAreNotFound) {
    EXPECT_EQ(tracker.MoveToTrash({"nope"})[0].result.kind, ErrorKind::NotFound);
    EXPECT_EQ(tracker.Restore({"nope"})[0].result.kind, ErrorKind::NotFound);
    EXPECT_EQ(tracker.Purge({"nope"})[0].result.kind, ErrorKind::NotFound);
}

TEST_F(InstallTrackerTest, CorruptStateFailsOpen) {
    ASSERT_TRUE(testutil::WriteTextFile(At(".packsmith/installed.json"), "{ broken"));

    InstallTracker t;
    auto res = InstallTracker::Open(tmp.Path(), ".packsmith", t);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ManifestCorrupt);

    ASSERT_TRUE(testutil::WriteTextFile(At(".packsmith/installed.json"), R"({"format": 1, "components": []})"));
    ASSERT_TRUE(testutil::WriteTextFile(At(".packsmith/trash.json"), R"({"format": 1, "entries": [{"component_id": 3}]})"));
    res = InstallTracker::Open(tmp.Path(), ".packsmith", t);
    EXPECT_EQ(res.kind, ErrorKind::ManifestCorrupt);
}

} // namespace
} // namespace packsmith
