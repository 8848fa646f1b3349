#pragma once

#include "commit_message.hpp"
#include "llm_backend.hpp"
#include <string>
#include <vector>

struct Config {
    std::string model;
    std::vector<std::string> exclude;
    std::string api_base;
    double temperature;
    bool staged;
    RetryPolicy retry;
    CommitPolicy policy;
    // Replaces the generated instruction block when non-empty.
    std::string llm_instructions;

    // Global file first, then <repo_root>/.commitgen.conf on top when
    // repo_root is non-empty. Throws ConfigurationError on invalid values.
    static Config load_from_file(const std::string& path, const std::string& repo_root = "");
};

std::string get_config_path();

// Name of the environment variable holding the API key.
extern const char* const API_KEY_ENV;

// Reads the API key once; throws ConfigurationError when it is unset.
std::string read_api_key();

void configure_app(const std::string& config_path);
