#include "shell/Usage.hpp"

namespace ad::shell {

CommandUsage Usage::ls() {
    CommandUsage u;
    u.command = "ls";
    u.command_aliases = {"list"};
    u.description = "Print one file category as sorted absolute paths, one per line.";
    u.positionals = {
        {"category", "owned (package), backup, live (all), repo, modified (modified-backup), unpackaged, "
                     "missing (missing-in-repo), diverged (diverged-from-repo), deleted", {}},
    };
    u.examples = {
        {"archdiff ls unpackaged --quick", "Files no package owns, skipping the high-churn package trees"},
        {"archdiff --root /mnt ls modified", "Edited config files of a system mounted at /mnt"},
    };
    return u;
}

CommandUsage Usage::status() {
    CommandUsage u;
    u.command = "status";
    u.command_aliases = {"st"};
    u.description = "Print every file missing from the repository or diverged from it, sorted by path.";
    u.optional = {
        {"--annotate", "Prefix each path with B (modified backup), ? (unpackaged) or R (diverged from repo)", {"-a"}},
    };
    return u;
}

CommandUsage Usage::sync() {
    CommandUsage u;
    u.command = "sync";
    u.description = "Copy missing files into the repository and resolve diverged files in favour of the newer copy.";
    u.optional = {
        {"--dry-run", "Print the cp commands instead of copying", {"-n"}},
    };
    u.examples = {
        {"archdiff sync -n", "Show what would be copied"},
    };
    return u;
}

CommandUsage Usage::help() {
    CommandUsage u;
    u.command = "help";
    u.description = "Show the command overview, or details for one command.";
    u.positionals = {{"[command]", "Command to describe", {}}};
    return u;
}

std::vector<Entry> Usage::global() {
    return {
        {"--config <file>", "YAML configuration (default /etc/archdiff/config.yaml)", {}},
        {"--root <dir>", "Alternate installation root (default /)", {}},
        {"--dbpath <dir>", "Alternate pacman database location (default /var/lib/pacman)", {}},
        {"--repo <dir>", "Shadow repository (default /usr/share/archdiff)", {}},
        {"--ignore <path>", "Ignore rule file or directory (default /etc/archdiff/ignore)", {}},
        {"--git", "List the repository with git ls-files instead of walking it", {}},
        {"--quick", "Also ignore the preset high-churn package directories", {"-q"}},
        {"--strict", "Abort on permission errors instead of skipping", {}},
        {"--quiet", "Do not log skipped unreadable files", {"-s"}},
        {"--dry-run", "Never modify files (sync prints cp commands)", {"-n"}},
        {"--verbose", "Debug logging on stderr", {"-v"}},
        {"--help", "Show help", {"-h"}},
    };
}

CommandBook Usage::all() {
    CommandBook book;
    book.title = "archdiff - compare a pacman system against its package database and a shadow repository";
    book.global = global();
    book.commands = {ls(), status(), sync(), help()};
    return book;
}

const std::unordered_set<std::string>& Usage::valueFlags() {
    static const std::unordered_set<std::string> flags{"config", "root", "dbpath", "repo", "ignore"};
    return flags;
}

const std::unordered_set<std::string>& Usage::globalFlags() {
    static const std::unordered_set<std::string> flags = [] {
        std::unordered_set<std::string> out;
        for (const auto& e : global()) {
            const auto label = stripDashes(e.label);
            out.insert(label.substr(0, label.find(' ')));
            for (const auto& a : e.aliases) out.insert(stripDashes(a));
        }
        return out;
    }();
    return flags;
}

}
