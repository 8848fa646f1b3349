#include "config.hpp"
#include "errors.hpp"
#include "model_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <sys/ioctl.h>
#include <unistd.h>

const char* const API_KEY_ENV = "OPENAI_API_KEY";

namespace {

const std::string DEFAULT_API_BASE = "https://api.openai.com/v1";

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string read_file_content(const std::string& path) {
    std::ifstream file(path);
    if (!file) return "";
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::map<std::string, std::string> parse_config_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) return values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            values[key] = value;
        }
    }
    return values;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += ",";
        result += item;
    }
    return result;
}

[[noreturn]] void invalid_value(const std::string& path, const std::string& key, const std::string& value) {
    throw ConfigurationError("Invalid value for '" + key + "' in " + path + ": '" + value + "'");
}

bool parse_bool(const std::string& path, const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    invalid_value(path, key, value);
}

// Accepts 1..INT_MAX so every key fits the int and chrono fields it sets.
int parse_positive(const std::string& path, const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used == value.size() && n > 0 && n <= std::numeric_limits<int>::max()) {
            return static_cast<int>(n);
        }
    } catch (const std::logic_error&) {
        // falls through to the error below
    }
    invalid_value(path, key, value);
}

double parse_temperature(const std::string& path, const std::string& value) {
    try {
        size_t used = 0;
        double t = std::stod(value, &used);
        if (used == value.size() && t >= 0.0 && t <= 2.0) {
            return t;
        }
    } catch (const std::logic_error&) {
        // falls through to the error below
    }
    invalid_value(path, "temperature", value);
}

void apply_values(Config& config, std::map<std::string, std::string>& values, const std::string& path) {
    if (values.count("model")) config.model = values["model"];
    if (values.count("exclude")) config.exclude = split_list(values["exclude"]);
    if (values.count("api_base")) config.api_base = values["api_base"];
    if (values.count("temperature")) config.temperature = parse_temperature(path, values["temperature"]);
    if (values.count("staged")) config.staged = parse_bool(path, "staged", values["staged"]);
    if (values.count("max_attempts")) {
        config.retry.max_attempts = parse_positive(path, "max_attempts", values["max_attempts"]);
    }
    if (values.count("timeout_seconds")) {
        config.retry.total_timeout = std::chrono::seconds(parse_positive(path, "timeout_seconds", values["timeout_seconds"]));
    }
    if (values.count("initial_backoff_ms")) {
        config.retry.initial_backoff = std::chrono::milliseconds(parse_positive(path, "initial_backoff_ms", values["initial_backoff_ms"]));
    }
    if (values.count("max_backoff_ms")) {
        config.retry.max_backoff = std::chrono::milliseconds(parse_positive(path, "max_backoff_ms", values["max_backoff_ms"]));
    }
    if (values.count("types")) {
        std::vector<std::string> types = split_list(values["types"]);
        if (types.empty()) {
            invalid_value(path, "types", values["types"]);
        }
        for (auto& type : types) {
            std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
        }
        config.policy.types = types;
    }
    if (values.count("require_scope")) config.policy.require_scope = parse_bool(path, "require_scope", values["require_scope"]);
    if (values.count("max_description_length")) {
        config.policy.max_description_length = static_cast<size_t>(parse_positive(path, "max_description_length", values["max_description_length"]));
    }
}

void save_config(const Config& config, const std::string& config_path) {
    std::filesystem::create_directories(std::filesystem::path(config_path).parent_path());
    if (std::filesystem::exists(config_path)) {
        std::filesystem::copy_file(config_path, config_path + ".bak", std::filesystem::copy_options::overwrite_existing);
    }
    std::ofstream file(config_path);
    if (!file) {
        throw ConfigurationError("Could not write " + config_path);
    }
    file << "# Model tier (default, advanced, advanced-fast)\n";
    file << "model=" << config.model << "\n";
    file << "# Comma-separated paths or patterns left out of the diff\n";
    file << "exclude=" << join_list(config.exclude) << "\n";
    file << "# Base URL of the OpenAI-compatible API\n";
    file << "api_base=" << config.api_base << "\n";
    file << "# Temperature for chat generation (0.0-2.0)\n";
    file << "temperature=" << config.temperature << "\n";
    file << "# Describe only staged changes\n";
    file << "staged=" << (config.staged ? "true" : "false") << "\n";
    file << "# Retry budget and total time allowed for generation\n";
    file << "max_attempts=" << config.retry.max_attempts << "\n";
    file << "timeout_seconds=" << std::chrono::duration_cast<std::chrono::seconds>(config.retry.total_timeout).count() << "\n";
    file << "initial_backoff_ms=" << config.retry.initial_backoff.count() << "\n";
    file << "max_backoff_ms=" << config.retry.max_backoff.count() << "\n";
    file << "# Accepted conventional commit types\n";
    file << "types=" << join_list(config.policy.types) << "\n";
    file << "require_scope=" << (config.policy.require_scope ? "true" : "false") << "\n";
    file << "max_description_length=" << config.policy.max_description_length << "\n";
}

} // namespace

std::string get_config_path() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string config_dir;
    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            throw ConfigurationError("HOME environment variable not set");
        }
        config_dir = std::string(home) + "/.config";
    }
    return config_dir + "/commitgen/config.txt";
}

std::string read_api_key() {
    const char* key = std::getenv(API_KEY_ENV);
    if (!key || strlen(key) == 0) {
        throw ConfigurationError(std::string(API_KEY_ENV) + " is not set; export your API key before running commitgen");
    }
    return key;
}

Config Config::load_from_file(const std::string& global_path, const std::string& repo_root) {
    Config config;
    config.model = "default";
    config.api_base = DEFAULT_API_BASE;
    config.temperature = 0.2;
    config.staged = false;

    auto global_values = parse_config_file(global_path);
    apply_values(config, global_values, global_path);

    std::string global_prompt_path = std::filesystem::path(global_path).parent_path().string() + "/prompt.txt";
    if (std::filesystem::exists(global_prompt_path)) {
        std::string content = read_file_content(global_prompt_path);
        if (!trim(content).empty()) {
            config.llm_instructions = content;
        }
    }

    if (!repo_root.empty()) {
        std::string local_path = (std::filesystem::path(repo_root) / ".commitgen.conf").string();
        auto local_values = parse_config_file(local_path);
        apply_values(config, local_values, local_path);

        std::string local_prompt_path = (std::filesystem::path(repo_root) / ".commitgen" / "prompt.txt").string();
        if (std::filesystem::exists(local_prompt_path)) {
            std::string content = read_file_content(local_prompt_path);
            if (!trim(content).empty()) {
                config.llm_instructions = content;
            }
        }
    }

    return config;
}

void configure_app(const std::string& config_path) {
    struct winsize ws;
    int terminal_height = 24;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        terminal_height = ws.ws_row;
    }

    Config existing = Config::load_from_file(config_path);

    enum class ConfigStep { Model, Types };
    ConfigStep current_step = ConfigStep::Model;

    std::vector<std::string> model_names;
    int model_index = 0;
    for (const auto& model : available_models()) {
        model_names.push_back(model.identifier + " (" + model.backend_model + ")");
    }
    try {
        model_index = static_cast<int>(resolve_model(existing.model));
    } catch (const UnknownModelError&) {
        model_index = 0;
    }

    std::string types = join_list(existing.policy.types);
    bool saved = false;

    ftxui::MenuOption model_option;
    auto model_menu = ftxui::Menu(&model_names, &model_index, model_option);
    ftxui::InputOption types_option;
    auto types_input = ftxui::Input(&types, "feat,fix,docs,...", types_option);

    auto screen = ftxui::ScreenInteractive::TerminalOutput();

    auto layout = ftxui::Container::Vertical(std::vector<ftxui::Component>{
        ftxui::Renderer(model_menu, [&] {
            if (current_step != ConfigStep::Model) return ftxui::text("");
            return ftxui::vbox(
                ftxui::text("Selected: " + model_names[model_index]) | ftxui::bold,
                ftxui::text("Select default model:"),
                ftxui::frame(model_menu->Render()) | ftxui::size(ftxui::HEIGHT, ftxui::LESS_THAN, terminal_height - 10)
            );
        }),
        ftxui::Renderer(types_input, [&] {
            if (current_step != ConfigStep::Types) return ftxui::text("");
            return ftxui::vbox(ftxui::text("Accepted commit types (comma-separated):"), types_input->Render());
        }),
    });

    auto renderer = ftxui::Renderer(layout, [&] {
        std::string step_title = (current_step == ConfigStep::Model) ? "Step 1/2: Select Model" : "Step 2/2: Edit Commit Types";
        return ftxui::vbox(
            ftxui::text("Configuration Setup") | ftxui::bold,
            ftxui::text(step_title) | ftxui::dim,
            ftxui::separator(),
            layout->Render() | ftxui::flex,
            ftxui::separator(),
            ftxui::text("Press Enter to advance, Esc to cancel")
        ) | ftxui::border | ftxui::size(ftxui::HEIGHT, ftxui::LESS_THAN, terminal_height);
    });

    auto event_handler = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
        if (event == ftxui::Event::Return) {
            if (current_step == ConfigStep::Model) {
                current_step = ConfigStep::Types;
                types_input->TakeFocus();
            } else {
                saved = true;
                screen.ExitLoopClosure()();
            }
        } else if (event == ftxui::Event::Escape) {
            screen.ExitLoopClosure()();
        } else if (event.is_mouse()) {
            return true;
        }
        return (event == ftxui::Event::Return || event == ftxui::Event::Escape);
    });

    model_menu->TakeFocus();
    screen.Loop(event_handler);

    if (!saved) {
        std::cout << "Configuration unchanged" << std::endl;
        return;
    }

    std::vector<std::string> type_list = split_list(types);
    if (type_list.empty()) {
        throw ConfigurationError("At least one commit type is required");
    }
    existing.model = available_models()[model_index].identifier;
    existing.policy.types = type_list;
    save_config(existing, config_path);
    std::cout << "Configuration saved to " << config_path << std::endl;
}
