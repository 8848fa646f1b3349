#include "model_resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

const size_t BYTES_PER_TOKEN = 4;

const std::vector<ModelConfig>& model_table() {
    static const std::vector<ModelConfig> models = {
        {ModelId::Default, "default", "gpt-3.5-turbo", 16385, 1024},
        {ModelId::Advanced, "advanced", "gpt-4", 8192, 1024},
        {ModelId::AdvancedFast, "advanced-fast", "gpt-4-turbo", 128000, 1024},
    };
    return models;
}

// Names accepted in addition to the tier identifiers.
const std::vector<std::pair<std::string, ModelId>>& model_aliases() {
    static const std::vector<std::pair<std::string, ModelId>> aliases = {
        {"gpt3.5", ModelId::Default},
        {"gpt4", ModelId::Advanced},
        {"gpt4-turbo", ModelId::AdvancedFast},
    };
    return aliases;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

size_t ModelConfig::input_budget_bytes() const {
    return static_cast<size_t>(context_tokens - max_output_tokens) * BYTES_PER_TOKEN;
}

ModelId resolve_model(const std::string& identifier) {
    if (identifier.empty()) {
        return ModelId::Default;
    }
    std::string key = to_lower(identifier);
    for (const auto& model : model_table()) {
        if (model.identifier == key) {
            return model.id;
        }
    }
    for (const auto& [alias, id] : model_aliases()) {
        if (alias == key) {
            return id;
        }
    }
    throw UnknownModelError(identifier);
}

const ModelConfig& model_config(ModelId id) {
    for (const auto& model : model_table()) {
        if (model.id == id) {
            return model;
        }
    }
    return model_table().front();
}

const std::vector<ModelConfig>& available_models() {
    return model_table();
}
