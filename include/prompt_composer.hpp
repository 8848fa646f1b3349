#pragma once

#include "change_collector.hpp"
#include "model_resolver.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct GenerationRequest {
    std::string instructions;
    std::optional<std::string> context;
    ChangeSet diff;
    ModelId model = ModelId::Default;
    // Files dropped or cut to fit the model's input budget, in eviction order.
    std::vector<std::string> truncated_files;

    // Context block followed by the file changes; sent as the user message.
    std::string user_content() const;
    size_t prompt_size() const;

    bool operator==(const GenerationRequest& other) const;
};

class PromptComposer {
public:
    explicit PromptComposer(std::string instructions) : instructions_(std::move(instructions)) {}

    GenerationRequest compose(const ChangeSet& changes, const std::optional<std::string>& context, ModelId model) const;

    // Same as above with an explicit budget in bytes instead of the model's.
    GenerationRequest compose(const ChangeSet& changes, const std::optional<std::string>& context, ModelId model,
                              size_t budget_bytes) const;

    const std::string& instructions() const { return instructions_; }

private:
    std::string instructions_;
};
