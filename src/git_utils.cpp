#include "git_utils.hpp"
#include "errors.hpp"
#include <git2.h>
#include <string>

namespace {

void init_libgit2() {
    static const int init_result = git_libgit2_init();
    (void)init_result;
}

std::string last_git_error(const std::string& what) {
    const git_error *err = git_error_last();
    if (err && err->message) {
        return what + ": " + err->message;
    }
    return what;
}

git_repository *open_repository() {
    init_libgit2();
    git_repository *repo = nullptr;
    int error = git_repository_open_ext(&repo, ".", 0, nullptr);
    if (error != 0) {
        throw VcsUnavailableError(last_git_error("Not inside a git repository"));
    }
    return repo;
}

// Tree of the HEAD commit, or nullptr on an unborn branch (diffs then run
// against the empty tree).
git_tree *head_tree(git_repository *repo) {
    git_reference *head_ref = nullptr;
    int error = git_repository_head(&head_ref, repo);
    if (error == GIT_EUNBORNBRANCH || error == GIT_ENOTFOUND) {
        return nullptr;
    }
    if (error != 0) {
        throw VcsUnavailableError(last_git_error("Failed to resolve HEAD"));
    }
    git_commit *head_commit = nullptr;
    error = git_reference_peel((git_object **)&head_commit, head_ref, GIT_OBJECT_COMMIT);
    git_reference_free(head_ref);
    if (error != 0) {
        throw VcsUnavailableError(last_git_error("Failed to read HEAD commit"));
    }
    git_tree *tree = nullptr;
    error = git_commit_tree(&tree, head_commit);
    git_commit_free(head_commit);
    if (error != 0) {
        throw VcsUnavailableError(last_git_error("Failed to read HEAD tree"));
    }
    return tree;
}

} // namespace

std::string GitUtils::get_repo_root() {
    init_libgit2();
    git_repository *repo = nullptr;
    int error = git_repository_open_ext(&repo, ".", 0, nullptr);
    if (error != 0) {
        return "";
    }
    const char *workdir = git_repository_workdir(repo);
    std::string result = workdir ? workdir : "";
    git_repository_free(repo);
    return result;
}

std::string GitUtils::get_diff(bool staged_only) {
    git_repository *repo = open_repository();

    git_tree *tree = nullptr;
    try {
        tree = head_tree(repo);
    } catch (...) {
        git_repository_free(repo);
        throw;
    }

    git_diff *diff = nullptr;
    int error = 0;
    if (staged_only) {
        git_index *index = nullptr;
        error = git_repository_index(&index, repo);
        if (error == 0) {
            error = git_diff_tree_to_index(&diff, repo, tree, index, nullptr);
            git_index_free(index);
        }
    } else {
        error = git_diff_tree_to_workdir_with_index(&diff, repo, tree, nullptr);
    }
    git_tree_free(tree);
    if (error != 0) {
        std::string msg = last_git_error("Failed to create diff");
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    git_buf buf = {0};
    error = git_diff_to_buf(&buf, diff, GIT_DIFF_FORMAT_PATCH);
    if (error != 0) {
        std::string msg = last_git_error("Failed to format diff");
        git_buf_dispose(&buf);
        git_diff_free(diff);
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }
    std::string result = buf.ptr ? std::string(buf.ptr, buf.size) : "";
    git_buf_dispose(&buf);
    git_diff_free(diff);
    git_repository_free(repo);
    return result;
}

std::pair<std::string, std::string> GitUtils::commit_with_output(const std::string& message, bool staged_only) {
    git_repository *repo = open_repository();

    git_index *index = nullptr;
    int error = git_repository_index(&index, repo);
    if (error == 0 && !staged_only) {
        error = git_index_update_all(index, nullptr, nullptr, nullptr);
        if (error == 0) {
            error = git_index_write(index);
        }
    }
    git_oid tree_oid;
    if (error == 0) {
        error = git_index_write_tree(&tree_oid, index);
    }
    git_index_free(index);
    if (error != 0) {
        std::string msg = last_git_error("Failed to stage changes");
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    git_tree *tree = nullptr;
    if (git_tree_lookup(&tree, repo, &tree_oid) != 0) {
        std::string msg = last_git_error("Failed to look up index tree");
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    git_commit *parent_commit = nullptr;
    git_reference *head_ref = nullptr;
    error = git_repository_head(&head_ref, repo);
    if (error == 0) {
        error = git_reference_peel((git_object **)&parent_commit, head_ref, GIT_OBJECT_COMMIT);
        git_reference_free(head_ref);
    } else if (error == GIT_EUNBORNBRANCH || error == GIT_ENOTFOUND) {
        error = 0;
    }
    if (error != 0) {
        std::string msg = last_git_error("Failed to resolve HEAD");
        git_tree_free(tree);
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    git_signature *author = nullptr;
    if (git_signature_default(&author, repo) != 0) {
        std::string msg = last_git_error("No git identity configured (set user.name and user.email)");
        git_commit_free(parent_commit);
        git_tree_free(tree);
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    const git_commit *parents[] = {parent_commit};
    size_t parent_count = parent_commit ? 1 : 0;
    git_oid commit_oid;
    error = git_commit_create(&commit_oid, repo, "HEAD", author, author, "UTF-8", message.c_str(), tree, parent_count, parents);
    git_signature_free(author);
    git_commit_free(parent_commit);
    git_tree_free(tree);
    if (error != 0) {
        std::string msg = last_git_error("Git commit failed");
        git_repository_free(repo);
        throw VcsUnavailableError(msg);
    }

    char hash_str[8];
    git_oid_tostr(hash_str, sizeof(hash_str), &commit_oid);
    std::string hash = hash_str;
    std::string summary = message.substr(0, message.find('\n'));
    git_repository_free(repo);
    return {hash, "[" + hash + "] " + summary};
}

std::string GitDiffSource::read_diff() {
    return GitUtils::get_diff(staged_only_);
}
