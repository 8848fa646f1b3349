#pragma once

#include "change_collector.hpp"
#include <git2.h>
#include <string>
#include <utility>

class GitUtils {
public:
    // Empty when the current directory is not inside a work tree.
    static std::string get_repo_root();
    // HEAD against the working tree (index included), or HEAD against the
    // index when staged_only is set. Throws VcsUnavailableError.
    static std::string get_diff(bool staged_only = false);
    // Commits the index, first staging modified tracked files unless
    // staged_only is set. Returns {short hash, summary line}.
    static std::pair<std::string, std::string> commit_with_output(const std::string& message, bool staged_only = false);
};

class GitDiffSource : public DiffSource {
public:
    explicit GitDiffSource(bool staged_only = false) : staged_only_(staged_only) {}
    std::string read_diff() override;

private:
    bool staged_only_;
};
