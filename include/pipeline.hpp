#pragma once

#include "change_collector.hpp"
#include "commit_message.hpp"
#include "llm_backend.hpp"
#include "prompt_composer.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

enum class Stage {
    Idle,
    Resolving,
    Collecting,
    Composing,
    Generating,
    Normalizing,
    Done,
    Failed
};

const char* stage_name(Stage stage);

struct Invocation {
    std::string model;
    std::optional<std::string> context;
    std::vector<std::string> exclude;
};

// Runs one invocation: resolve the model, collect and filter the diff,
// compose the prompt, generate, normalize. Any failure leaves the pipeline in
// Stage::Failed (failed_stage() tells where) and is rethrown unchanged.
class Pipeline {
public:
    Pipeline(DiffSource& source, Generator& generator, CommitPolicy policy, std::string instructions = "",
             std::ostream& log = std::cerr, bool verbose = false);

    CommitMessage run(const Invocation& invocation);

    // The progress line is drawn only on a terminal stderr, and never in
    // verbose mode where diagnostics share the stream.
    bool progress_enabled() const;

    Stage stage() const { return stage_; }
    Stage failed_stage() const { return failed_stage_; }
    // The request handed to the generator, once composed.
    const std::optional<GenerationRequest>& request() const { return request_; }

private:
    DiffSource& source_;
    Generator& generator_;
    CommitPolicy policy_;
    std::string instructions_;
    std::ostream& log_;
    bool verbose_;
    Stage stage_ = Stage::Idle;
    Stage failed_stage_ = Stage::Idle;
    std::optional<GenerationRequest> request_;

    void enter(Stage stage);
};
