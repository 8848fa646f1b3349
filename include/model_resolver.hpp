#pragma once

#include <cstddef>
#include <string>
#include <vector>

enum class ModelId {
    Default,
    Advanced,
    AdvancedFast
};

struct ModelConfig {
    ModelId id;
    std::string identifier;      // user-facing tier name
    std::string backend_model;   // model name sent to the API
    int context_tokens;
    int max_output_tokens;

    // Bytes of prompt the tier accepts, estimated at four bytes per token
    // after reserving room for the reply.
    size_t input_budget_bytes() const;
};

// Case-insensitive. Empty selects ModelId::Default. Throws UnknownModelError.
ModelId resolve_model(const std::string& identifier);

const ModelConfig& model_config(ModelId id);

const std::vector<ModelConfig>& available_models();
