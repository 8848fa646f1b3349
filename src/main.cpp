#include <CLI/CLI.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "clipboard.hpp"
#include "colors.hpp"
#include "config.hpp"
#include "curl_request.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "llm_backend.hpp"
#include "model_resolver.hpp"
#include "pipeline.hpp"

namespace {

std::string guidance_for(ErrorKind kind, const std::string& config_path) {
    switch (kind) {
        case ErrorKind::Configuration:
            return "Check the command line and " + config_path + ", or run 'commitgen --configure'.";
        case ErrorKind::NoChanges:
            return "Make some changes (stage them when using --staged) and run again.";
        case ErrorKind::VcsUnavailable:
            return "Run commitgen inside a git working tree.";
        case ErrorKind::Auth:
            return std::string("Check the key in ") + API_KEY_ENV + ".";
        case ErrorKind::TransientService:
        case ErrorKind::Timeout:
            return "The service may be overloaded; try again later or raise timeout_seconds.";
        case ErrorKind::InvalidMessageFormat:
            return "Run again to get a new message, or pass --context to steer the model.";
        default:
            return "";
    }
}

void print_models() {
    for (const auto& model : available_models()) {
        std::cout << model.identifier << "\n";
        std::cout << "  Backend model: " << model.backend_model << "\n";
        std::cout << "  Context window: " << model.context_tokens << " tokens\n";
        std::cout << "  Prompt budget: " << model.input_budget_bytes() << " bytes\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"commitgen - Generate conventional commit messages from pending changes"};

    std::string context;
    std::vector<std::string> excludes;
    std::string model;
    std::string config_path;
    bool staged = false;
    bool commit = false;
    bool copy = false;
    bool verbose = false;
    bool list_models = false;
    bool configure = false;

    try {
        config_path = get_config_path();
    } catch (const ConfigurationError& e) {
        std::cerr << Colors::RED << "Error: " << Colors::RESET << e.what() << std::endl;
        return exit_code_for(e.kind());
    }

    app.set_help_flag("--help", "Print help message");
    app.footer("Configuration file location: " + config_path + "\nAPI key is read from " + API_KEY_ENV);
    auto* context_option = app.add_option("-c,--context", context, "Free-text context about the changes, added to the prompt");
    app.add_option("-e,--exclude", excludes, "Files, directories or glob patterns to leave out of the diff");
    app.add_option("-m,--model", model, "Model tier: default, advanced or advanced-fast");
    app.add_option("--config", config_path, "Path to config file");
    app.add_flag("--staged", staged, "Describe only staged changes");
    app.add_flag("--commit", commit, "Create the commit with the generated message");
    app.add_flag("--copy", copy, "Also copy the message to the system clipboard");
    app.add_flag("-v,--verbose", verbose, "Print pipeline diagnostics to stderr");
    app.add_flag("--list-models", list_models, "List the available model tiers");
    app.add_flag("--configure", configure, "Configure the application interactively");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? 0 : exit_code_for(ErrorKind::Configuration);
    }

    if (list_models) {
        print_models();
        return 0;
    }

    try {
        if (configure) {
            configure_app(config_path);
            return 0;
        }

        // Bad caller input is reported before the repository is touched.
        if (!model.empty()) {
            resolve_model(model);
        }

        install_interrupt_handler();
        CurlGlobal curl_global;

        std::string repo_root = GitUtils::get_repo_root();
        Config config = Config::load_from_file(config_path, repo_root);
        std::string api_key = read_api_key();

        Invocation invocation;
        invocation.model = model.empty() ? config.model : model;
        if (context_option->count() > 0 && !context.empty()) {
            invocation.context = context;
        }
        invocation.exclude = config.exclude;
        invocation.exclude.insert(invocation.exclude.end(), excludes.begin(), excludes.end());
        staged = staged || config.staged;

        CancellationToken& cancel = CancellationToken::interrupt();
        GitDiffSource source(staged);
        CurlTransport transport(cancel);
        OpenAIBackend backend(api_key, config.api_base, transport, cancel, config.retry);
        backend.set_temperature(config.temperature);
        if (verbose) {
            backend.set_diagnostics(&std::cerr);
        }

        Pipeline pipeline(source, backend, config.policy, config.llm_instructions, std::cerr, verbose);
        CommitMessage message = pipeline.run(invocation);
        if (cancel.cancelled()) {
            throw CancelledError();
        }

        std::string text = message.to_string();
        std::cout << text << std::endl;

        if (copy) {
            try {
                copy_to_clipboard(text);
                std::cerr << Colors::GREEN << "Copied to clipboard" << Colors::RESET << std::endl;
            } catch (const std::runtime_error& e) {
                // the message is already on stdout
                std::cerr << Colors::YELLOW << "Warning: " << e.what() << Colors::RESET << std::endl;
            }
        }

        if (commit) {
            auto [hash, summary] = GitUtils::commit_with_output(text, staged);
            std::cerr << Colors::GREEN << "Committed " << Colors::RESET << Colors::BLUE << hash << Colors::RESET
                      << " " << summary.substr(summary.find(' ') + 1) << std::endl;
        }
        return 0;
    } catch (const CommitError& e) {
        std::cerr << Colors::RED << "Error (" << error_kind_name(e.kind()) << "): " << Colors::RESET << e.what() << std::endl;
        std::string guidance = guidance_for(e.kind(), config_path);
        if (!guidance.empty()) {
            std::cerr << Colors::YELLOW << guidance << Colors::RESET << std::endl;
        }
        if (verbose && !e.raw().empty()) {
            std::cerr << Colors::DIM << "Raw text:" << Colors::RESET << "\n" << e.raw() << std::endl;
        }
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << Colors::RED << "Error: " << Colors::RESET << e.what() << std::endl;
        return 1;
    }
}
