#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// How strictly generated messages are held to the conventional-commit grammar.
struct CommitPolicy {
    std::vector<std::string> types = {"feat", "fix", "docs", "style", "refactor", "perf",
                                      "test", "build", "ci", "chore", "revert"};
    bool require_scope = false;
    size_t max_description_length = 72;
    // How far into the header a misspelled or decorated type may start and
    // still be recovered.
    size_t correction_window = 16;

    bool allows_type(const std::string& type) const;
};

struct CommitMessage {
    std::string type;
    std::optional<std::string> scope;
    std::string description;
    std::optional<std::string> body;
    bool breaking = false;

    std::string header() const;
    std::string to_string() const;
};

// Parses raw model output into a CommitMessage, stripping code fences, quotes
// and whitespace. Throws InvalidMessageFormatError with the raw text attached.
CommitMessage normalize(const std::string& raw, const CommitPolicy& policy = CommitPolicy());
