#include <gtest/gtest.h>
#include "runtime/Pipeline.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Usage.hpp"
#include "shell/commands.hpp"
#include "error/Exceptions.hpp"
#include "pkgdb/Database.hpp"
#include "TestTree.hpp"

using namespace ad;
using namespace ad::shell;
using namespace ad::test;
using reconcile::model::Category;

namespace sfs = std::filesystem;

// One small system on disk:
//   /etc/pacman.conf   backup file, edited since install, absent from the repo
//   /etc/hostname      unpackaged, older copy in the repo
//   /usr/bin/tool      owned, untouched
//   /usr/bin/gone      owned, deleted from the live tree
//   /tmp/scratch       unpackaged but ignored
class PipelineTest : public TempTreeTest {
protected:
    sfs::path live, repo, db, ignoreFile;
    config::Config cfg;

    void SetUp() override {
        TempTreeTest::SetUp();
        live = base / "live";
        repo = base / "repo";
        db = base / "db";
        ignoreFile = base / "ignore";

        writePackage(db, "pacman", {"etc/", "etc/pacman.conf", "usr/", "usr/bin/", "usr/bin/tool", "usr/bin/gone"},
                     {{"etc/pacman.conf", MD5_HELLO}});

        writeTextFile(live / "etc/pacman.conf", "edited\n");
        writeTextFile(live / "etc/hostname", "box\n");
        writeTextFile(live / "usr/bin/tool", "#!/bin/sh\n");
        writeTextFile(live / "tmp/scratch", "junk\n");

        writeTextFile(repo / "etc/hostname", "oldbox\n");
        setMtime(repo / "etc/hostname", std::chrono::seconds(3600));

        writeTextFile(ignoreFile, "# scratch space\n/tmp\n");

        cfg.paths.root = live;
        cfg.paths.repo = repo;
        cfg.paths.dbpath = db;
        cfg.paths.ignore = ignoreFile;
    }

    [[nodiscard]] std::string L(const std::string& rel) const { return (live / rel).string(); }
    [[nodiscard]] std::string R(const std::string& rel) const { return (repo / rel).string(); }

    CommandResult run(const std::vector<std::string>& args) const {
        Router router;
        const auto config = cfg;
        registerAllCommands(router, [config] { return std::make_shared<const runtime::Pipeline>(config); });
        return router.execute(parseTokens(tokenize(args), Usage::valueFlags()));
    }
};

TEST_F(PipelineTest, ListsEveryCategory) {
    const runtime::Pipeline p(cfg);

    EXPECT_EQ(p.list(Category::Owned), (std::vector<std::string>{"/etc/pacman.conf", "/usr/bin/gone", "/usr/bin/tool"}));
    EXPECT_EQ(p.list(Category::Backup), (std::vector<std::string>{"/etc/pacman.conf"}));
    EXPECT_EQ(p.list(Category::Live), (std::vector<std::string>{"/etc/hostname", "/etc/pacman.conf", "/usr/bin/tool"}));
    EXPECT_EQ(p.list(Category::Repo), (std::vector<std::string>{"/etc/hostname"}));
    EXPECT_EQ(p.list(Category::ModifiedBackup), (std::vector<std::string>{"/etc/pacman.conf"}));
    EXPECT_EQ(p.list(Category::Unpackaged), (std::vector<std::string>{"/etc/hostname"}));
    EXPECT_EQ(p.list(Category::MissingInRepo), (std::vector<std::string>{"/etc/pacman.conf"}));
    EXPECT_EQ(p.list(Category::DivergedFromRepo), (std::vector<std::string>{"/etc/hostname"}));
    EXPECT_EQ(p.list(Category::Deleted), (std::vector<std::string>{"/usr/bin/gone"}));
}

TEST_F(PipelineTest, LsPrintsLivePaths) {
    const auto res = run({"ls", "unpackaged"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text, L("etc/hostname") + "\n");

    EXPECT_EQ(run({"list", "deleted"}).stdout_text, L("usr/bin/gone") + "\n");
    EXPECT_EQ(run({"ls", "backup"}).stdout_text, L("etc/pacman.conf") + "\n");
}

TEST_F(PipelineTest, LsRejectsBadArguments) {
    EXPECT_EQ(run({"ls", "everything"}).exit_code, 2);
    EXPECT_NE(run({"ls", "everything"}).stderr_text.find("Unknown category: everything"), std::string::npos);
    EXPECT_EQ(run({"ls"}).exit_code, 2);
    EXPECT_EQ(run({"ls", "owned", "live"}).exit_code, 2);
}

TEST_F(PipelineTest, StatusReportsMissingAndDiverged) {
    const auto res = run({"status"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text, L("etc/hostname") + "\n" + L("etc/pacman.conf") + "\n");
}

TEST_F(PipelineTest, AnnotatedStatus) {
    EXPECT_EQ(run({"st", "-a"}).stdout_text,
              "R " + L("etc/hostname") + "\n" + "B " + L("etc/pacman.conf") + "\n");
}

TEST_F(PipelineTest, DryRunSyncPrintsCopiesAndTouchesNothing) {
    const auto res = run({"sync", "-n"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text,
              "cp " + L("etc/hostname") + " " + R("etc/hostname") + "\n" +
              "cp " + L("etc/pacman.conf") + " " + R("etc/pacman.conf") + "\n");

    EXPECT_EQ(readTextFile(repo / "etc/hostname"), "oldbox\n");
    EXPECT_FALSE(sfs::exists(repo / "etc/pacman.conf"));
}

TEST_F(PipelineTest, DryRunFromConfig) {
    cfg.sync.dry_run = true;
    EXPECT_NE(run({"sync"}).stdout_text.find("cp "), std::string::npos);
    EXPECT_FALSE(sfs::exists(repo / "etc/pacman.conf"));
}

TEST_F(PipelineTest, SyncConvergesStatus) {
    const auto res = run({"sync"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_TRUE(res.stdout_text.empty());

    EXPECT_EQ(readTextFile(repo / "etc/hostname"), "box\n");
    EXPECT_EQ(readTextFile(repo / "etc/pacman.conf"), "edited\n");
    EXPECT_EQ(run({"status"}).stdout_text, "");
}

TEST_F(PipelineTest, RelativeSymlinkSettlesAfterOneSync) {
    writePackage(db, "systemd", {"run/", "run/resolved.conf"});
    writeTextFile(live / "run/resolved.conf", "nameserver 127.0.0.53\n");
    sfs::create_symlink("../run/resolved.conf", live / "etc/resolv.conf");

    EXPECT_NE(run({"status"}).stdout_text.find(L("etc/resolv.conf")), std::string::npos);

    EXPECT_EQ(run({"sync"}).exit_code, 0);
    ASSERT_TRUE(sfs::is_symlink(repo / "etc/resolv.conf"));
    EXPECT_EQ(sfs::read_symlink(repo / "etc/resolv.conf"), "../run/resolved.conf");

    EXPECT_EQ(run({"status"}).stdout_text, "");
    EXPECT_EQ(run({"sync", "-n"}).stdout_text, "");
    EXPECT_EQ(sfs::read_symlink(live / "etc/resolv.conf"), "../run/resolved.conf");
}

TEST_F(PipelineTest, NewerRepoCopyFlowsBackToLive) {
    setMtime(repo / "etc/hostname", std::chrono::seconds(0));
    setMtime(live / "etc/hostname", std::chrono::seconds(3600));

    EXPECT_NE(run({"sync", "-n"}).stdout_text.find("cp " + R("etc/hostname") + " " + L("etc/hostname")),
              std::string::npos);
}

TEST_F(PipelineTest, QuickAddsPresetRules) {
    writeTextFile(live / "usr/share/doc/readme", "x\n");

    EXPECT_EQ(runtime::Pipeline(cfg).list(Category::Unpackaged),
              (std::vector<std::string>{"/etc/hostname", "/usr/share/doc/readme"}));

    cfg.scan.quick = true;
    const runtime::Pipeline quick(cfg);
    EXPECT_TRUE(quick.matcher().matches("/usr/share/doc/readme"));
    EXPECT_EQ(quick.list(Category::Unpackaged), (std::vector<std::string>{"/etc/hostname"}));
}

TEST_F(PipelineTest, InlineRulesFollowRuleFile) {
    cfg.scan.ignore = {"/etc/host*"};
    const runtime::Pipeline p(cfg);
    EXPECT_EQ(p.matcher().size(), 2u);
    EXPECT_TRUE(p.list(Category::Unpackaged).empty());
}

TEST_F(PipelineTest, MalformedRuleFailsBeforeAnyWork) {
    writeTextFile(ignoreFile, "/tmp\n/etc/[abc\n");
    EXPECT_THROW({ runtime::Pipeline p(cfg); }, error::MalformedIgnoreRule);
}

TEST_F(PipelineTest, MissingDatabaseIsFatal) {
    cfg.paths.dbpath = base / "nowhere";
    const runtime::Pipeline p(cfg);
    EXPECT_THROW((void)p.list(Category::Owned), error::PackageDatabaseUnavailable);
    EXPECT_THROW((void)p.diff(), error::PackageDatabaseUnavailable);

    // categories that never touch the database still work
    EXPECT_EQ(p.list(Category::Repo), (std::vector<std::string>{"/etc/hostname"}));
}

TEST_F(PipelineTest, InjectedDatabaseReplacesLocalOne) {
    auto fake = std::make_shared<const pkgdb::StaticDatabase>(std::vector<pkgdb::model::Package>{
        {.name = "hostname", .version = "1", .files = {"/etc/hostname"}, .backups = {}},
    });
    const runtime::Pipeline p(cfg, fake);
    EXPECT_EQ(p.list(Category::Unpackaged), (std::vector<std::string>{"/etc/pacman.conf", "/usr/bin/tool"}));
}
