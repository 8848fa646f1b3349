#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "config.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path global_path;
    fs::path repo_root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("commitgen_config_test_" + std::to_string(::getpid()));
        fs::create_directories(root / "config");
        fs::create_directories(root / "repo");
        global_path = root / "config" / "config.txt";
        repo_root = root / "repo";
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFiles) {
    Config config = Config::load_from_file(global_path.string());
    EXPECT_EQ(config.model, "default");
    EXPECT_EQ(config.api_base, "https://api.openai.com/v1");
    EXPECT_TRUE(config.exclude.empty());
    EXPECT_FALSE(config.staged);
    EXPECT_TRUE(config.llm_instructions.empty());
    EXPECT_EQ(config.retry.max_attempts, 4);
    EXPECT_EQ(config.policy.max_description_length, 72u);
    EXPECT_TRUE(config.policy.allows_type("feat"));
}

TEST_F(ConfigTest, ReadsGlobalValues) {
    write(global_path,
          "# comment\n"
          "model=advanced\n"
          "exclude=package-lock.json, dist/ ,*.min.js\n"
          "temperature=0.7\n"
          "max_attempts=6\n"
          "timeout_seconds=30\n"
          "initial_backoff_ms=250\n"
          "types=Feat,fix,docs\n"
          "require_scope=true\n"
          "max_description_length=60\n"
          "staged=true\n");
    Config config = Config::load_from_file(global_path.string());
    EXPECT_EQ(config.model, "advanced");
    EXPECT_EQ(config.exclude, (std::vector<std::string>{"package-lock.json", "dist/", "*.min.js"}));
    EXPECT_DOUBLE_EQ(config.temperature, 0.7);
    EXPECT_EQ(config.retry.max_attempts, 6);
    EXPECT_EQ(config.retry.total_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.retry.initial_backoff, std::chrono::milliseconds(250));
    EXPECT_EQ(config.policy.types, (std::vector<std::string>{"feat", "fix", "docs"}));
    EXPECT_TRUE(config.policy.require_scope);
    EXPECT_EQ(config.policy.max_description_length, 60u);
    EXPECT_TRUE(config.staged);
}

TEST_F(ConfigTest, AcceptsTheLargestIntValue) {
    write(global_path, "max_attempts=2147483647\n");
    EXPECT_EQ(Config::load_from_file(global_path.string()).retry.max_attempts, 2147483647);
}

TEST_F(ConfigTest, RepositoryFileOverridesGlobal) {
    write(global_path, "model=advanced\nmax_attempts=6\n");
    write(repo_root / ".commitgen.conf", "model=advanced-fast\n");
    Config config = Config::load_from_file(global_path.string(), repo_root.string());
    EXPECT_EQ(config.model, "advanced-fast");
    EXPECT_EQ(config.retry.max_attempts, 6);
}

TEST_F(ConfigTest, PromptFilesReplaceInstructions) {
    write(root / "config" / "prompt.txt", "global instructions\n");
    Config global_only = Config::load_from_file(global_path.string(), repo_root.string());
    EXPECT_EQ(global_only.llm_instructions, "global instructions\n");

    write(repo_root / ".commitgen" / "prompt.txt", "repository instructions\n");
    Config config = Config::load_from_file(global_path.string(), repo_root.string());
    EXPECT_EQ(config.llm_instructions, "repository instructions\n");
}

TEST_F(ConfigTest, InvalidValuesAreConfigurationErrors) {
    const char* invalid[] = {"max_attempts=0\n", "max_attempts=three\n", "timeout_seconds=-5\n",
                             "temperature=hot\n", "temperature=3.5\n", "require_scope=yes\n", "types= , \n",
                             "max_attempts=4294967297\n", "max_description_length=99999999999999999999\n",
                             "timeout_seconds=2147483648\n"};
    for (const char* content : invalid) {
        write(global_path, content);
        EXPECT_THROW(Config::load_from_file(global_path.string()), ConfigurationError) << content;
    }
}

class ApiKeyTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* current = std::getenv(API_KEY_ENV);
        had_key = current != nullptr;
        saved = current ? current : "";
    }

    void TearDown() override {
        if (had_key) {
            ::setenv(API_KEY_ENV, saved.c_str(), 1);
        } else {
            ::unsetenv(API_KEY_ENV);
        }
    }

    bool had_key = false;
    std::string saved;
};

TEST_F(ApiKeyTest, ReadsTheEnvironment) {
    ::setenv(API_KEY_ENV, "sk-test", 1);
    EXPECT_EQ(read_api_key(), "sk-test");
}

TEST_F(ApiKeyTest, MissingOrEmptyKeyIsAConfigurationError) {
    ::unsetenv(API_KEY_ENV);
    try {
        read_api_key();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(exit_code_for(e.kind()), 2);
        EXPECT_NE(std::string(e.what()).find(API_KEY_ENV), std::string::npos);
    }

    ::setenv(API_KEY_ENV, "", 1);
    EXPECT_THROW(read_api_key(), ConfigurationError);
}
