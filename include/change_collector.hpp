#pragma once

#include <string>
#include <vector>

struct FileDiff {
    std::string path;
    std::string hunk_text;

    bool operator==(const FileDiff& other) const {
        return path == other.path && hunk_text == other.hunk_text;
    }
};

using ChangeSet = std::vector<FileDiff>;

// Paths excluded from the change set. An entry matches a path exactly, as a
// directory prefix ("docs" or "docs/" covers "docs/x.md"), or as an fnmatch
// pattern when it contains one of "*?[".
class ExclusionSet {
public:
    ExclusionSet() = default;
    explicit ExclusionSet(const std::vector<std::string>& entries);

    bool excludes(const std::string& path) const;
    bool empty() const { return entries_.empty(); }
    const std::vector<std::string>& entries() const { return entries_; }

private:
    std::vector<std::string> entries_;
};

// Source of unified diff text for the pending changes.
class DiffSource {
public:
    virtual ~DiffSource() = default;
    virtual std::string read_diff() = 0;
};

// Splits unified diff text on its "diff --git" headers. Text before the first
// header is ignored.
ChangeSet parse_unified_diff(const std::string& diff);

class ChangeCollector {
public:
    explicit ChangeCollector(DiffSource& source) : source_(source) {}

    // Throws VcsUnavailableError when the diff cannot be produced and
    // NoChangesError when nothing is left after exclusions.
    ChangeSet collect(const ExclusionSet& exclusions);

private:
    DiffSource& source_;
};
