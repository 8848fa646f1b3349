#include "pipeline.hpp"
#include "colors.hpp"
#include "default_prompt.hpp"
#include "model_resolver.hpp"
#include "spinner.hpp"
#include <utility>

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Idle: return "idle";
        case Stage::Resolving: return "resolving";
        case Stage::Collecting: return "collecting";
        case Stage::Composing: return "composing";
        case Stage::Generating: return "generating";
        case Stage::Normalizing: return "normalizing";
        case Stage::Done: return "done";
        case Stage::Failed: return "failed";
    }
    return "unknown";
}

Pipeline::Pipeline(DiffSource& source, Generator& generator, CommitPolicy policy, std::string instructions,
                   std::ostream& log, bool verbose)
    : source_(source),
      generator_(generator),
      policy_(std::move(policy)),
      instructions_(std::move(instructions)),
      log_(log),
      verbose_(verbose) {
    if (instructions_.empty()) {
        instructions_ = default_llm_instructions(policy_);
    }
}

bool Pipeline::progress_enabled() const {
    return !verbose_ && &log_ == &std::cerr && Spinner::stderr_is_terminal();
}

void Pipeline::enter(Stage stage) {
    stage_ = stage;
    if (verbose_) {
        log_ << Colors::DIM << "[" << stage_name(stage) << "]" << Colors::RESET << std::endl;
    }
}

CommitMessage Pipeline::run(const Invocation& invocation) {
    request_.reset();
    try {
        enter(Stage::Resolving);
        ModelId model = resolve_model(invocation.model);
        if (verbose_) {
            log_ << "Model: " << model_config(model).identifier << " (" << model_config(model).backend_model << ")" << std::endl;
        }

        enter(Stage::Collecting);
        ChangeCollector collector(source_);
        ChangeSet changes = collector.collect(ExclusionSet(invocation.exclude));
        if (verbose_) {
            log_ << "Files: " << changes.size() << std::endl;
            for (const auto& file : changes) {
                log_ << "  " << file.path << " (" << file.hunk_text.size() << " bytes)" << std::endl;
            }
        }

        enter(Stage::Composing);
        PromptComposer composer(instructions_);
        request_ = composer.compose(changes, invocation.context, model);
        if (!request_->truncated_files.empty()) {
            log_ << Colors::YELLOW << "Warning: diff exceeds the model's input budget; left out or shortened:";
            for (const auto& path : request_->truncated_files) {
                log_ << " " << path;
            }
            log_ << Colors::RESET << std::endl;
        }

        enter(Stage::Generating);
        std::string raw;
        {
            Spinner spinner(log_, "Generating commit message with " + model_config(model).backend_model,
                            progress_enabled());
            raw = generator_.generate(*request_);
        }

        enter(Stage::Normalizing);
        CommitMessage message = normalize(raw, policy_);

        enter(Stage::Done);
        return message;
    } catch (...) {
        failed_stage_ = stage_;
        stage_ = Stage::Failed;
        throw;
    }
}
