#include "inventory/RepoLister.hpp"
#include "error/Exceptions.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

using namespace ad::inventory;
using namespace ad::log;
using namespace ad::error;

WalkLister::WalkLister(std::filesystem::path repoRoot, const fs::Walker::Options opts)
    : repoRoot_(std::move(repoRoot)), opts_(opts) {}

PathSet WalkLister::list() const {
    const auto gitDir = repoRoot_ / ".git";
    const fs::Walker walker(opts_);
    const auto files = walker.files(repoRoot_, [&](const fs::Walker::Entry& entry) {
        return entry.is_directory && entry.path == gitDir;
    });

    PathSet repo;
    repo.reserve(files.size());
    for (const auto& f : files)
        repo.insert(fs::model::canonicalKey(f.lexically_relative(repoRoot_).string()));
    return repo;
}

GitLister::GitLister(std::filesystem::path repoRoot, std::string gitBinary)
    : repoRoot_(std::move(repoRoot)), gitBinary_(std::move(gitBinary)) {}

PathSet GitLister::list() const {
    int pipefd[2];
    if (pipe(pipefd) == -1)
        throw RepoListingFailed(fmt::format("Failed to create pipe for git: {}", std::strerror(errno)));

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw RepoListingFailed(fmt::format("Failed to fork git process: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child: git writes the NUL-separated listing into the pipe
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        const std::string repo = repoRoot_.string();
        const std::vector<const char*> args = {
            gitBinary_.c_str(),
            "-C", repo.c_str(),
            "ls-files",
            "-z",
            nullptr
        };
        execvp(gitBinary_.c_str(), const_cast<char* const*>(args.data()));
        _exit(127); // exec failed
    }

    // Parent: drain the listing, then reap
    close(pipefd[1]);

    std::string output;
    char buf[8192];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            close(pipefd[0]);
            waitpid(pid, nullptr, 0);
            throw RepoListingFailed(fmt::format("Failed to read git output: {}", std::strerror(err)));
        }
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw RepoListingFailed(fmt::format("Failed to wait for git: {}", std::strerror(errno)));
    }

    if (!WIFEXITED(status))
        throw RepoListingFailed("git ls-files terminated abnormally in " + repoRoot_.string());
    if (WEXITSTATUS(status) == 127)
        throw RepoListingFailed(fmt::format("Could not run '{}'", gitBinary_));
    if (WEXITSTATUS(status) != 0)
        throw RepoListingFailed(fmt::format("git ls-files failed in {} with status {}", repoRoot_.string(), WEXITSTATUS(status)));

    PathSet repo;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) end = output.size();
        if (end > start) repo.insert(fs::model::canonicalKey(output.substr(start, end - start)));
        start = end + 1;
    }

    Registry::inventory()->debug("[GitLister] {} tracked files in {}", repo.size(), repoRoot_.string());
    return repo;
}
