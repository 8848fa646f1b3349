#include "prompt_composer.hpp"
#include <algorithm>
#include <numeric>

namespace {

const std::string FILE_SEPARATOR = "\n---------------------------\n name:";
const std::string TRUNCATION_MARKER = "[truncated]\n";

std::string render_file(const FileDiff& file) {
    std::string block = FILE_SEPARATOR + file.path + "\n" + file.hunk_text;
    if (block.back() != '\n') {
        block += '\n';
    }
    return block;
}

std::string render_context(const std::optional<std::string>& context) {
    if (!context) {
        return "";
    }
    return "Some context about the changes:\n<<<CONTEXT\n" + *context + "\nCONTEXT>>>\n\n";
}

// Cuts the hunk at a line boundary so that it shrinks by at least `excess` bytes.
std::string clip_hunk(const std::string& hunk, size_t excess) {
    if (excess + TRUNCATION_MARKER.size() >= hunk.size()) {
        return TRUNCATION_MARKER;
    }
    size_t keep = hunk.size() - excess - TRUNCATION_MARKER.size();
    size_t newline = hunk.rfind('\n', keep - 1);
    keep = (newline == std::string::npos) ? 0 : newline + 1;
    return hunk.substr(0, keep) + TRUNCATION_MARKER;
}

} // namespace

std::string GenerationRequest::user_content() const {
    std::string content = render_context(context);
    content += "File changes:\n";
    for (const auto& file : diff) {
        content += render_file(file);
    }
    return content;
}

size_t GenerationRequest::prompt_size() const {
    return instructions.size() + user_content().size();
}

bool GenerationRequest::operator==(const GenerationRequest& other) const {
    return instructions == other.instructions && context == other.context && diff == other.diff &&
           model == other.model && truncated_files == other.truncated_files;
}

GenerationRequest PromptComposer::compose(const ChangeSet& changes, const std::optional<std::string>& context,
                                          ModelId model) const {
    return compose(changes, context, model, model_config(model).input_budget_bytes());
}

GenerationRequest PromptComposer::compose(const ChangeSet& changes, const std::optional<std::string>& context,
                                          ModelId model, size_t budget_bytes) const {
    GenerationRequest request;
    request.instructions = instructions_;
    request.context = context;
    request.model = model;

    std::vector<size_t> block_sizes;
    size_t total = instructions_.size() + render_context(context).size() + std::string("File changes:\n").size();
    for (const auto& file : changes) {
        block_sizes.push_back(render_file(file).size());
        total += block_sizes.back();
    }

    // Largest hunk first; on ties the later file goes first.
    std::vector<size_t> order(changes.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (changes[a].hunk_text.size() != changes[b].hunk_text.size()) {
            return changes[a].hunk_text.size() > changes[b].hunk_text.size();
        }
        return a > b;
    });

    std::vector<bool> evicted(changes.size(), false);
    size_t remaining = changes.size();
    for (size_t index : order) {
        if (total <= budget_bytes || remaining <= 1) {
            break;
        }
        evicted[index] = true;
        total -= block_sizes[index];
        --remaining;
        request.truncated_files.push_back(changes[index].path);
    }

    for (size_t i = 0; i < changes.size(); ++i) {
        if (!evicted[i]) {
            request.diff.push_back(changes[i]);
        }
    }

    if (total > budget_bytes && request.diff.size() == 1) {
        FileDiff& last = request.diff.front();
        last.hunk_text = clip_hunk(last.hunk_text, total - budget_bytes);
        request.truncated_files.push_back(last.path);
    }
    return request;
}
