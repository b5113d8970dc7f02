#include <gtest/gtest.h>
#include "sync/Planner.hpp"
#include "sync/Executor.hpp"
#include "reconcile/model/Diff.hpp"
#include "fs/model/Path.hpp"
#include "TestTree.hpp"

#include <sstream>
#include <unistd.h>

using namespace ad;
using namespace ad::sync;
using namespace ad::sync::model;
using namespace ad::test;
using namespace std::chrono_literals;

namespace sfs = std::filesystem;

TEST(SyncDecisionTest, NewerSideWins) {
    EXPECT_EQ(Planner::decideForBoth(200ns, 100ns), ActionType::LiveToRepo);
    EXPECT_EQ(Planner::decideForBoth(100ns, 200ns), ActionType::RepoToLive);
}

TEST(SyncDecisionTest, MissingSideIsOldest) {
    EXPECT_EQ(Planner::decideForBoth(100ns, std::nullopt), ActionType::LiveToRepo);
    EXPECT_EQ(Planner::decideForBoth(std::nullopt, 100ns), ActionType::RepoToLive);
    EXPECT_FALSE(Planner::decideForBoth(std::nullopt, std::nullopt).has_value());
}

TEST(SyncDecisionTest, EqualStampsDoNothing) {
    EXPECT_FALSE(Planner::decideForBoth(100ns, 100ns).has_value());
}

class SyncTest : public TempTreeTest {
protected:
    sfs::path live, repo;
    std::unique_ptr<fs::model::Path> paths;

    void SetUp() override {
        TempTreeTest::SetUp();
        live = base / "live";
        repo = base / "repo";
        sfs::create_directories(live);
        sfs::create_directories(repo);
        paths = std::make_unique<fs::model::Path>(live, repo);
    }

    static reconcile::model::Diff diffOf(std::vector<std::string> missing, std::vector<std::string> diverged) {
        return {.modifiedBackup = {}, .unpackaged = missing, .missingInRepo = missing, .divergedFromRepo = diverged};
    }
};

TEST_F(SyncTest, MissingInRepoCopiesLiveToRepo) {
    writeTextFile(live / "etc/a.conf", "a");

    const auto plan = Planner::build(*paths, diffOf({"/etc/a.conf"}, {}));
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], (Action{ActionType::LiveToRepo, "/etc/a.conf", live / "etc/a.conf", repo / "etc/a.conf"}));
}

TEST_F(SyncTest, DivergedCopiesFromNewerToOlderEitherWay) {
    writeTextFile(live / "etc/live-newer", "new");
    writeTextFile(repo / "etc/live-newer", "old");
    setMtime(repo / "etc/live-newer", 3600s);

    writeTextFile(live / "etc/repo-newer", "old");
    writeTextFile(repo / "etc/repo-newer", "new");
    setMtime(live / "etc/repo-newer", 3600s);

    const auto plan = Planner::build(*paths, diffOf({}, {"/etc/live-newer", "/etc/repo-newer"}));
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0].type, ActionType::LiveToRepo);
    EXPECT_EQ(plan[0].source, live / "etc/live-newer");
    EXPECT_EQ(plan[1].type, ActionType::RepoToLive);
    EXPECT_EQ(plan[1].source, repo / "etc/repo-newer");
    EXPECT_EQ(plan[1].destination, live / "etc/repo-newer");
}

TEST_F(SyncTest, DivergedWithDeletedLiveCopyRestoresFromRepo) {
    writeTextFile(repo / "etc/restored", "r");
    const auto plan = Planner::build(*paths, diffOf({}, {"/etc/restored"}));
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].type, ActionType::RepoToLive);
}

TEST_F(SyncTest, EqualModificationTimesAreLeftAlone) {
    writeTextFile(live / "etc/tie", "one");
    writeTextFile(repo / "etc/tie", "two");
    const auto stamp = sfs::last_write_time(live / "etc/tie");
    sfs::last_write_time(repo / "etc/tie", stamp);

    EXPECT_TRUE(Planner::build(*paths, diffOf({}, {"/etc/tie"})).empty());
}

TEST_F(SyncTest, PlanFollowsReportOrder) {
    for (const auto* k : {"/b", "/a", "/c"}) writeTextFile(live / (k + 1), k);
    writeTextFile(repo / "b", "older");
    setMtime(repo / "b", 3600s);

    const auto plan = Planner::build(*paths, diffOf({"/a", "/c"}, {"/b"}));
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0].key, "/a");
    EXPECT_EQ(plan[1].key, "/b");
    EXPECT_EQ(plan[2].key, "/c");
}

TEST_F(SyncTest, DryRunPrintsCopiesAndTouchesNothing) {
    writeTextFile(live / "etc/a.conf", "a");
    const std::vector<Action> plan{{ActionType::LiveToRepo, "/etc/a.conf", live / "etc/a.conf", repo / "etc/a.conf"}};

    std::ostringstream out;
    const auto result = Executor::run(plan, true, out);

    EXPECT_EQ(out.str(), "cp " + (live / "etc/a.conf").string() + " " + (repo / "etc/a.conf").string() + "\n");
    EXPECT_EQ(result.copied, 0u);
    EXPECT_FALSE(sfs::exists(repo / "etc/a.conf"));
}

TEST_F(SyncTest, CopyCreatesParentsAndOverwrites) {
    writeTextFile(live / "etc/deep/nested/a.conf", "fresh");
    writeTextFile(live / "etc/b.conf", "new b");
    writeTextFile(repo / "etc/b.conf", "old b");

    const std::vector<Action> plan{
        {ActionType::LiveToRepo, "/etc/deep/nested/a.conf", live / "etc/deep/nested/a.conf", repo / "etc/deep/nested/a.conf"},
        {ActionType::LiveToRepo, "/etc/b.conf", live / "etc/b.conf", repo / "etc/b.conf"},
    };

    std::ostringstream out;
    const auto result = Executor::run(plan, false, out);

    EXPECT_EQ(result.copied, 2u);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(readTextFile(repo / "etc/deep/nested/a.conf"), "fresh");
    EXPECT_EQ(readTextFile(repo / "etc/b.conf"), "new b");
}

TEST_F(SyncTest, SymlinksAreCopiedAsLinks) {
    sfs::create_directories(live / "etc");
    sfs::create_symlink("/usr/share/zoneinfo/UTC", live / "etc/localtime");

    const std::vector<Action> plan{{ActionType::LiveToRepo, "/etc/localtime", live / "etc/localtime", repo / "etc/localtime"}};
    std::ostringstream out;
    (void)Executor::run(plan, false, out);

    ASSERT_TRUE(sfs::is_symlink(repo / "etc/localtime"));
    EXPECT_EQ(sfs::read_symlink(repo / "etc/localtime"), "/usr/share/zoneinfo/UTC");
}

TEST_F(SyncTest, RegularFileReplacesLinkInsteadOfWritingThroughIt) {
    writeTextFile(base / "outside", "untouched");
    writeTextFile(repo / "etc/hosts", "repo hosts");
    sfs::create_directories(live / "etc");
    sfs::create_symlink(base / "outside", live / "etc/hosts");

    const std::vector<Action> plan{{ActionType::RepoToLive, "/etc/hosts", repo / "etc/hosts", live / "etc/hosts"}};
    std::ostringstream out;
    (void)Executor::run(plan, false, out);

    EXPECT_FALSE(sfs::is_symlink(live / "etc/hosts"));
    EXPECT_EQ(readTextFile(live / "etc/hosts"), "repo hosts");
    EXPECT_EQ(readTextFile(base / "outside"), "untouched");
}

TEST_F(SyncTest, PermissionErrorSkipsAndContinues) {
    if (::geteuid() == 0) GTEST_SKIP() << "root bypasses directory permissions";

    writeTextFile(live / "a", "a");
    writeTextFile(live / "b", "b");
    sfs::create_directories(repo / "locked");
    sfs::permissions(repo / "locked", sfs::perms::owner_read | sfs::perms::owner_exec);

    const std::vector<Action> plan{
        {ActionType::LiveToRepo, "/locked/a", live / "a", repo / "locked/a"},
        {ActionType::LiveToRepo, "/b", live / "b", repo / "b"},
    };
    std::ostringstream out;
    const auto result = Executor::run(plan, false, out);

    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.copied, 1u);
    EXPECT_EQ(readTextFile(repo / "b"), "b");

    sfs::permissions(repo / "locked", sfs::perms::owner_all);
}
