#pragma once

#include "pkgdb/model/Package.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace ad::pkgdb {

// Read-only view of the installed packages.
class Database {
public:
    virtual ~Database() = default;

    [[nodiscard]] virtual const std::vector<model::Package>& packages() const = 0;
};

// pacman's local database: <dbpath>/local/<name>-<version>/{desc,files}.
class LocalDatabase final : public Database {
public:
    // Throws error::PackageDatabaseUnavailable.
    explicit LocalDatabase(const std::filesystem::path& dbpath);

    [[nodiscard]] const std::vector<model::Package>& packages() const override { return packages_; }

    // Parses one package directory. Exposed for tests.
    static model::Package readPackage(const std::filesystem::path& pkgDir);

private:
    std::filesystem::path local_;
    std::vector<model::Package> packages_;
};

// Fixed package list, for tests and for callers that already hold the data.
class StaticDatabase final : public Database {
public:
    explicit StaticDatabase(std::vector<model::Package> packages) : packages_(std::move(packages)) {}

    [[nodiscard]] const std::vector<model::Package>& packages() const override { return packages_; }

private:
    std::vector<model::Package> packages_;
};

}
