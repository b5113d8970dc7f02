#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "error/Exceptions.hpp"
#include "TestTree.hpp"

using namespace ad::config;
using namespace ad::test;

class ConfigTest : public TempTreeTest {};

TEST_F(ConfigTest, DefaultsMatchPacmanLayout) {
    const Config cfg;
    EXPECT_EQ(cfg.paths.root, "/");
    EXPECT_EQ(cfg.paths.dbpath, "/var/lib/pacman");
    EXPECT_EQ(cfg.paths.repo, "/usr/share/archdiff");
    EXPECT_EQ(cfg.paths.ignore, "/etc/archdiff/ignore");
    EXPECT_EQ(cfg.repo.lister, RepoListerType::Walk);
    EXPECT_FALSE(cfg.scan.quick);
    EXPECT_FALSE(cfg.sync.dry_run);
    EXPECT_FALSE(cfg.scan.quick_ignore.empty());
}

TEST_F(ConfigTest, LoadsEverySection) {
    writeTextFile(base / "config.yaml", R"(
paths:
  root: /mnt/sysroot
  dbpath: /mnt/sysroot/var/lib/pacman
  repo: /srv/etc-repo
  ignore: /srv/etc-repo.ignore
repo:
  lister: git
  git_binary: /usr/local/bin/git
scan:
  strict: true
  quiet: true
  quick: true
  quick_ignore:
    - /usr/lib
  ignore:
    - /var/lib/docker
    - "*.pacnew"
sync:
  dry_run: true
logging:
  log_dir: ""
  levels:
    console_log_level: warn
    subsystem_levels:
      sync: debug
)");

    const auto cfg = loadConfig(base / "config.yaml");
    EXPECT_EQ(cfg.paths.root, "/mnt/sysroot");
    EXPECT_EQ(cfg.paths.dbpath, "/mnt/sysroot/var/lib/pacman");
    EXPECT_EQ(cfg.paths.repo, "/srv/etc-repo");
    EXPECT_EQ(cfg.paths.ignore, "/srv/etc-repo.ignore");
    EXPECT_EQ(cfg.repo.lister, RepoListerType::Git);
    EXPECT_EQ(cfg.repo.git_binary, "/usr/local/bin/git");
    EXPECT_TRUE(cfg.scan.strict);
    EXPECT_TRUE(cfg.scan.quiet);
    EXPECT_TRUE(cfg.scan.quick);
    EXPECT_EQ(cfg.scan.quick_ignore, (std::vector<std::string>{"/usr/lib"}));
    EXPECT_EQ(cfg.scan.ignore, (std::vector<std::string>{"/var/lib/docker", "*.pacnew"}));
    EXPECT_TRUE(cfg.sync.dry_run);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.pkgdb, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    writeTextFile(base / "config.yaml", "paths:\n  repo: /srv/repo\n");
    const auto cfg = loadConfig(base / "config.yaml");
    EXPECT_EQ(cfg.paths.repo, "/srv/repo");
    EXPECT_EQ(cfg.paths.root, "/");
    EXPECT_EQ(cfg.paths.dbpath, "/var/lib/pacman");
    EXPECT_EQ(cfg.repo.lister, RepoListerType::Walk);
}

TEST_F(ConfigTest, EmptyFileIsAllDefaults) {
    writeTextFile(base / "config.yaml", "");
    const auto cfg = loadConfig(base / "config.yaml");
    EXPECT_EQ(cfg.paths.repo, "/usr/share/archdiff");
}

TEST_F(ConfigTest, MissingExplicitFileIsAnError) {
    EXPECT_THROW((void)loadConfig(base / "absent.yaml"), ad::error::IOError);
}

TEST_F(ConfigTest, MissingDefaultFileFallsBackToDefaults) {
    const auto cfg = loadConfigOrDefault(base / "absent.yaml");
    EXPECT_EQ(cfg.paths.root, "/");
}

TEST_F(ConfigTest, UnknownListerIsAnError) {
    writeTextFile(base / "config.yaml", "repo:\n  lister: svn\n");
    EXPECT_THROW((void)loadConfig(base / "config.yaml"), ad::error::IOError);
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    writeTextFile(base / "config.yaml", "paths: [unclosed\n");
    EXPECT_THROW((void)loadConfig(base / "config.yaml"), ad::error::IOError);
}

TEST_F(ConfigTest, WrongShapeIsAnError) {
    writeTextFile(base / "config.yaml", "scan: yes\n");
    EXPECT_THROW((void)loadConfig(base / "config.yaml"), ad::error::IOError);
}

TEST(RepoListerTypeTest, RoundTrip) {
    EXPECT_EQ(repoListerFromString(to_string(RepoListerType::Git)), RepoListerType::Git);
    EXPECT_EQ(repoListerFromString(to_string(RepoListerType::Walk)), RepoListerType::Walk);
    EXPECT_THROW((void)repoListerFromString("hg"), std::invalid_argument);
}
