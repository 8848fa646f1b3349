#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <git2.h>
#include <unistd.h>
#include "change_collector.hpp"
#include "errors.hpp"
#include "git_utils.hpp"

namespace fs = std::filesystem;

namespace {

bool has_path(const ChangeSet& changes, const std::string& path) {
    return std::any_of(changes.begin(), changes.end(), [&](const FileDiff& f) { return f.path == path; });
}

const FileDiff* find_path(const ChangeSet& changes, const std::string& path) {
    auto it = std::find_if(changes.begin(), changes.end(), [&](const FileDiff& f) { return f.path == path; });
    return it == changes.end() ? nullptr : &*it;
}

} // namespace

// Each test runs inside a fresh repository that is the current directory.
class GitUtilsTest : public ::testing::Test {
protected:
    fs::path original_dir;
    fs::path root;
    git_repository* repo = nullptr;

    void SetUp() override {
        git_libgit2_init();
        original_dir = fs::current_path();
        root = fs::temp_directory_path() / ("commitgen_git_test_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root / "repo");
        fs::create_directories(root / "plain");

        ASSERT_EQ(git_repository_init(&repo, (root / "repo").c_str(), 0), 0);
        git_config* config = nullptr;
        ASSERT_EQ(git_repository_config(&config, repo), 0);
        git_config_set_string(config, "user.name", "Commitgen Test");
        git_config_set_string(config, "user.email", "test@example.com");
        git_config_free(config);

        fs::current_path(root / "repo");
    }

    void TearDown() override {
        fs::current_path(original_dir);
        git_repository_free(repo);
        fs::remove_all(root);
        git_libgit2_shutdown();
    }

    void write(const std::string& path, const std::string& content) {
        std::ofstream out(root / "repo" / path);
        out << content;
    }

    void stage(const std::string& path) {
        git_index* index = nullptr;
        ASSERT_EQ(git_repository_index(&index, repo), 0);
        ASSERT_EQ(git_index_add_bypath(index, path.c_str()), 0);
        ASSERT_EQ(git_index_write(index), 0);
        git_index_free(index);
    }

    void commit_staged(const std::string& message) {
        GitUtils::commit_with_output(message, true);
    }

    ChangeSet diff(bool staged_only) {
        GitDiffSource source(staged_only);
        return parse_unified_diff(source.read_diff());
    }
};

TEST_F(GitUtilsTest, OutsideARepositoryCollectionFails) {
    fs::current_path(root / "plain");
    GitDiffSource source;
    ChangeCollector collector(source);
    EXPECT_THROW(collector.collect(ExclusionSet()), VcsUnavailableError);
    EXPECT_EQ(GitUtils::get_repo_root(), "");
}

TEST_F(GitUtilsTest, FindsTheRepositoryRoot) {
    fs::path root_path = fs::canonical(root / "repo");
    EXPECT_EQ(fs::canonical(GitUtils::get_repo_root()), root_path);
}

TEST_F(GitUtilsTest, UnbornHeadDiffsAgainstTheEmptyTree) {
    write("a.txt", "first line\n");
    stage("a.txt");

    ChangeSet changes = diff(false);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "a.txt");
    EXPECT_NE(changes[0].hunk_text.find("+first line"), std::string::npos);
    EXPECT_TRUE(has_path(diff(true), "a.txt"));
}

TEST_F(GitUtilsTest, StagedModeOnlySeesTheIndex) {
    write("a.txt", "a\n");
    write("b.txt", "b\n");
    stage("a.txt");
    stage("b.txt");
    commit_staged("chore: initial files");

    write("a.txt", "a\nstaged change\n");
    stage("a.txt");
    write("b.txt", "b\nunstaged change\n");

    ChangeSet staged = diff(true);
    ASSERT_EQ(staged.size(), 1u);
    EXPECT_EQ(staged[0].path, "a.txt");
    EXPECT_EQ(staged[0].hunk_text.find("unstaged change"), std::string::npos);

    ChangeSet all = diff(false);
    EXPECT_EQ(all.size(), 2u);
    const FileDiff* b = find_path(all, "b.txt");
    ASSERT_NE(b, nullptr);
    EXPECT_NE(b->hunk_text.find("+unstaged change"), std::string::npos);
}

TEST_F(GitUtilsTest, DeletedFilesAreIncluded) {
    write("gone.txt", "soon deleted\n");
    write("kept.txt", "kept\n");
    stage("gone.txt");
    stage("kept.txt");
    commit_staged("chore: initial files");

    fs::remove(root / "repo" / "gone.txt");

    ChangeSet changes = diff(false);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "gone.txt");
    EXPECT_NE(changes[0].hunk_text.find("-soon deleted"), std::string::npos);
}

TEST_F(GitUtilsTest, CleanTreeHasNoChanges) {
    write("a.txt", "a\n");
    stage("a.txt");
    commit_staged("chore: initial file");

    GitDiffSource source;
    ChangeCollector collector(source);
    EXPECT_THROW(collector.collect(ExclusionSet()), NoChangesError);
}

TEST_F(GitUtilsTest, CommitReportsShortHashAndSummary) {
    write("a.txt", "a\n");
    stage("a.txt");
    auto [hash, summary] = GitUtils::commit_with_output("feat: add a\n\nBody text.", true);
    EXPECT_EQ(hash.size(), 7u);
    EXPECT_EQ(summary, "[" + hash + "] feat: add a");
}
