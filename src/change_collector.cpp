#include "change_collector.hpp"
#include "errors.hpp"
#include <fnmatch.h>
#include <sstream>

namespace {

const std::string DIFF_HEADER = "diff --git ";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string normalize_entry(std::string entry) {
    while (starts_with(entry, "./")) {
        entry.erase(0, 2);
    }
    while (entry.size() > 1 && entry.back() == '/') {
        entry.pop_back();
    }
    return entry;
}

// "a/src/x.cpp b/src/x.cpp" -> "src/x.cpp". When both sides are equal the
// split point is unambiguous even if the path contains " b/".
std::string path_from_header(const std::string& rest) {
    if (rest.size() % 2 == 1) {
        size_t half = (rest.size() - 1) / 2;
        std::string left = rest.substr(0, half);
        std::string right = rest.substr(half + 1);
        if (starts_with(left, "a/") && starts_with(right, "b/") && left.substr(2) == right.substr(2)) {
            return right.substr(2);
        }
    }
    size_t pos = rest.rfind(" b/");
    if (pos != std::string::npos) {
        return rest.substr(pos + 3);
    }
    return rest;
}

std::string strip_marker_path(const std::string& line) {
    // "+++ b/path" or "--- a/path", optionally followed by a tab and timestamp
    std::string path = line.substr(4);
    size_t tab = path.find('\t');
    if (tab != std::string::npos) {
        path.erase(tab);
    }
    if (starts_with(path, "a/") || starts_with(path, "b/")) {
        path.erase(0, 2);
    }
    return path;
}

struct PendingFile {
    std::string header_path;
    std::string old_path;
    std::string new_path;
    std::string text;

    FileDiff finish() const {
        FileDiff file;
        if (!new_path.empty() && new_path != "/dev/null") {
            file.path = new_path;
        } else if (!old_path.empty() && old_path != "/dev/null") {
            file.path = old_path;
        } else {
            file.path = header_path;
        }
        file.hunk_text = text;
        return file;
    }
};

} // namespace

ExclusionSet::ExclusionSet(const std::vector<std::string>& entries) {
    for (const auto& entry : entries) {
        std::string normalized = normalize_entry(entry);
        if (!normalized.empty()) {
            entries_.push_back(normalized);
        }
    }
}

bool ExclusionSet::excludes(const std::string& path) const {
    for (const auto& entry : entries_) {
        if (entry.find_first_of("*?[") != std::string::npos) {
            if (fnmatch(entry.c_str(), path.c_str(), 0) == 0) {
                return true;
            }
            continue;
        }
        if (path == entry) {
            return true;
        }
        if (path.size() > entry.size() && starts_with(path, entry) && path[entry.size()] == '/') {
            return true;
        }
    }
    return false;
}

ChangeSet parse_unified_diff(const std::string& diff) {
    ChangeSet changes;
    std::istringstream in(diff);
    std::string line;
    PendingFile current;
    bool in_file = false;
    bool in_hunk = false;

    while (std::getline(in, line)) {
        if (starts_with(line, DIFF_HEADER)) {
            if (in_file) {
                changes.push_back(current.finish());
            }
            current = PendingFile();
            current.header_path = path_from_header(line.substr(DIFF_HEADER.size()));
            in_file = true;
            in_hunk = false;
        } else if (!in_file) {
            continue;
        } else if (!in_hunk && starts_with(line, "--- ")) {
            current.old_path = strip_marker_path(line);
        } else if (!in_hunk && starts_with(line, "+++ ")) {
            current.new_path = strip_marker_path(line);
        } else if (starts_with(line, "@@")) {
            in_hunk = true;
        }
        if (in_file) {
            current.text += line;
            current.text += '\n';
        }
    }
    if (in_file) {
        changes.push_back(current.finish());
    }
    return changes;
}

ChangeSet ChangeCollector::collect(const ExclusionSet& exclusions) {
    std::string diff = source_.read_diff();
    ChangeSet changes;
    for (auto& file : parse_unified_diff(diff)) {
        if (!exclusions.excludes(file.path)) {
            changes.push_back(std::move(file));
        }
    }
    if (changes.empty()) {
        throw NoChangesError();
    }
    return changes;
}
