#include "commit_message.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace {

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_artifacts(const std::string& raw) {
    std::string text;
    text.reserve(raw.size());
    for (char c : raw) {
        if (c != '\r') {
            text += c;
        }
    }

    std::string previous;
    while (previous != text) {
        previous = text;
        text = trim(text);
        // a closing fence goes only together with an opening one
        if (starts_with(text, "```")) {
            // drop the fence line together with any language tag
            size_t newline = text.find('\n');
            text = (newline == std::string::npos) ? text.substr(3) : text.substr(newline + 1);
            if (ends_with(text, "```")) {
                text.erase(text.size() - 3);
            }
        }
        text = trim(text);
        if (text.size() >= 2 && text.front() == text.back() &&
            (text.front() == '"' || text.front() == '\'' || text.front() == '`')) {
            text = text.substr(1, text.size() - 2);
        }
    }
    return text;
}

struct ParsedHeader {
    std::string type;
    std::string scope;
    bool breaking = false;
    std::string description;
};

bool parse_strict(const std::string& header, const CommitPolicy& policy, ParsedHeader& out) {
    static const std::regex strict(R"(^([A-Za-z]+)(?:\(([^()]*)\))?(!)?:\s*(.*)$)");
    std::smatch m;
    if (!std::regex_match(header, m, strict)) {
        return false;
    }
    std::string type = to_lower(m[1].str());
    if (!policy.allows_type(type)) {
        return false;
    }
    out.type = type;
    out.scope = trim(m[2].str());
    out.breaking = m[3].matched;
    out.description = trim(m[4].str());
    return true;
}

// Recovers headers such as "**fix**: ..." or "feature(ui): ..." where a known
// type starts a word near the beginning of the line.
bool parse_corrected(const std::string& header, const CommitPolicy& policy, ParsedHeader& out) {
    static const std::regex remainder(R"(^[A-Za-z]*[*_`]*(?:\(([^()]*)\))?(!)?[*_`]*:\s*(.*)$)");
    std::string lowered = to_lower(header);
    size_t window = std::min(policy.correction_window, lowered.size());

    for (size_t i = 0; i < window; ++i) {
        if (i > 0 && std::isalpha(static_cast<unsigned char>(lowered[i - 1]))) {
            continue;
        }
        const std::string* best = nullptr;
        for (const auto& type : policy.types) {
            if (lowered.compare(i, type.size(), type) == 0 && (!best || type.size() > best->size())) {
                best = &type;
            }
        }
        if (!best) {
            continue;
        }
        std::string rest = header.substr(i + best->size());
        std::smatch m;
        if (std::regex_match(rest, m, remainder)) {
            out.type = *best;
            out.scope = trim(m[1].str());
            out.breaking = m[2].matched;
            out.description = trim(m[3].str());
            return true;
        }
    }
    return false;
}

} // namespace

bool CommitPolicy::allows_type(const std::string& type) const {
    return std::find(types.begin(), types.end(), type) != types.end();
}

std::string CommitMessage::header() const {
    std::string result = type;
    if (scope) {
        result += "(" + *scope + ")";
    }
    if (breaking) {
        result += "!";
    }
    result += ": " + description;
    return result;
}

std::string CommitMessage::to_string() const {
    if (body) {
        return header() + "\n\n" + *body;
    }
    return header();
}

CommitMessage normalize(const std::string& raw, const CommitPolicy& policy) {
    std::string text = strip_artifacts(raw);
    if (text.empty()) {
        throw InvalidMessageFormatError("Generated message is empty", raw);
    }

    size_t newline = text.find('\n');
    std::string header = trim(text.substr(0, newline));
    std::string rest = (newline == std::string::npos) ? "" : text.substr(newline + 1);

    ParsedHeader parsed;
    if (!parse_strict(header, policy, parsed) && !parse_corrected(header, policy, parsed)) {
        throw InvalidMessageFormatError("Message header is not in 'type(scope): description' form with a known type", raw);
    }

    CommitMessage message;
    message.type = parsed.type;
    if (!parsed.scope.empty()) {
        message.scope = parsed.scope;
    }
    message.breaking = parsed.breaking;
    message.description = parsed.description;

    if (policy.require_scope && !message.scope) {
        throw InvalidMessageFormatError("Message has no scope but a scope is required", raw);
    }
    if (message.description.empty()) {
        throw InvalidMessageFormatError("Message description is empty", raw);
    }
    if (message.description.size() > policy.max_description_length) {
        throw InvalidMessageFormatError("Message description is longer than " +
                                        std::to_string(policy.max_description_length) + " characters", raw);
    }

    // Body starts at the first non-blank line after the header.
    size_t pos = 0;
    while (pos < rest.size()) {
        size_t end = rest.find('\n', pos);
        std::string line = rest.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (!trim(line).empty()) {
            break;
        }
        pos = (end == std::string::npos) ? rest.size() : end + 1;
    }
    std::string body = rest.substr(pos);
    body.erase(std::find_if_not(body.rbegin(), body.rend(), [](unsigned char ch) { return std::isspace(ch); }).base(), body.end());
    if (!body.empty()) {
        message.body = body;
    }
    return message;
}
