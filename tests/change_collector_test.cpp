#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <utility>
#include "change_collector.hpp"
#include "errors.hpp"

namespace {

class StaticDiffSource : public DiffSource {
public:
    explicit StaticDiffSource(std::string diff) : diff_(std::move(diff)) {}
    std::string read_diff() override { return diff_; }

private:
    std::string diff_;
};

class FailingDiffSource : public DiffSource {
public:
    std::string read_diff() override { throw VcsUnavailableError("Not inside a git repository"); }
};

bool has_path(const ChangeSet& changes, const std::string& path) {
    return std::any_of(changes.begin(), changes.end(), [&](const FileDiff& f) { return f.path == path; });
}

} // namespace

class ChangeCollectorTest : public ::testing::Test {
protected:
    const std::string multi_file_diff = R"(diff --git a/src/a.go b/src/a.go
index 1234567..abcdefg 100644
--- a/src/a.go
+++ b/src/a.go
@@ -1,2 +1,5 @@
 package a
+
+func Feature() string {
+	return "new"
+}
diff --git a/docs/x.md b/docs/x.md
index 1234567..abcdefg 100644
--- a/docs/x.md
+++ b/docs/x.md
@@ -1 +1,2 @@
 # Docs
+More words.
diff --git a/README.md b/README.md
index 1234567..abcdefg 100644
--- a/README.md
+++ b/README.md
@@ -1 +1 @@
-old
+new
)";

    const std::string readme_only_diff = R"(diff --git a/README.md b/README.md
index 1234567..abcdefg 100644
--- a/README.md
+++ b/README.md
@@ -1 +1 @@
-old
+new
)";

    const std::string deleted_and_binary_diff = R"(diff --git a/gone.txt b/gone.txt
deleted file mode 100644
index 1234567..0000000
--- a/gone.txt
+++ /dev/null
@@ -1,2 +0,0 @@
-line one
--- looks like a header but is content
diff --git a/img/logo.png b/img/logo.png
index 1234567..abcdefg 100644
Binary files a/img/logo.png and b/img/logo.png differ
)";
};

TEST_F(ChangeCollectorTest, ParsesOneRecordPerFile) {
    ChangeSet changes = parse_unified_diff(multi_file_diff);
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].path, "src/a.go");
    EXPECT_EQ(changes[1].path, "docs/x.md");
    EXPECT_EQ(changes[2].path, "README.md");
    EXPECT_EQ(changes[0].hunk_text.rfind("diff --git a/src/a.go b/src/a.go\n", 0), 0u);
    EXPECT_NE(changes[0].hunk_text.find("+func Feature() string {"), std::string::npos);
    EXPECT_EQ(changes[1].hunk_text.find("Feature"), std::string::npos);
}

TEST_F(ChangeCollectorTest, ParsesDeletedAndBinaryFiles) {
    ChangeSet changes = parse_unified_diff(deleted_and_binary_diff);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].path, "gone.txt");
    EXPECT_NE(changes[0].hunk_text.find("--- looks like a header"), std::string::npos);
    EXPECT_EQ(changes[1].path, "img/logo.png");
}

TEST_F(ChangeCollectorTest, EmptyDiffParsesToNothing) {
    EXPECT_TRUE(parse_unified_diff("").empty());
    EXPECT_TRUE(parse_unified_diff("warning: no newline\n").empty());
}

TEST_F(ChangeCollectorTest, CollectWithoutExclusionsKeepsEverything) {
    StaticDiffSource source(multi_file_diff);
    ChangeCollector collector(source);
    ChangeSet changes = collector.collect(ExclusionSet());
    EXPECT_EQ(changes, parse_unified_diff(multi_file_diff));
}

TEST_F(ChangeCollectorTest, ExclusionsPartitionTheChangeSet) {
    StaticDiffSource source(multi_file_diff);
    ChangeCollector collector(source);
    ExclusionSet exclusions({"README.md"});
    ChangeSet changes = collector.collect(exclusions);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_FALSE(has_path(changes, "README.md"));
    EXPECT_TRUE(has_path(changes, "src/a.go"));
    EXPECT_TRUE(has_path(changes, "docs/x.md"));
    for (const auto& file : changes) {
        EXPECT_FALSE(exclusions.excludes(file.path));
    }
}

TEST_F(ChangeCollectorTest, DirectoryExclusionMatchesByPrefix) {
    StaticDiffSource source(multi_file_diff);
    ChangeCollector collector(source);
    ChangeSet changes = collector.collect(ExclusionSet({"docs/"}));
    EXPECT_FALSE(has_path(changes, "docs/x.md"));
    EXPECT_EQ(changes.size(), 2u);
}

TEST_F(ChangeCollectorTest, ExclusionMatching) {
    ExclusionSet exclusions({"./docs", "build/", "*.lock", "README.md"});
    EXPECT_TRUE(exclusions.excludes("docs"));
    EXPECT_TRUE(exclusions.excludes("docs/guide/intro.md"));
    EXPECT_FALSE(exclusions.excludes("docsite/index.md"));
    EXPECT_TRUE(exclusions.excludes("build/out.o"));
    EXPECT_TRUE(exclusions.excludes("Cargo.lock"));
    EXPECT_TRUE(exclusions.excludes("README.md"));
    EXPECT_FALSE(exclusions.excludes("src/README.md"));
    EXPECT_FALSE(exclusions.excludes("README.md.orig"));
}

TEST_F(ChangeCollectorTest, ExcludingEveryFileFailsWithNoChanges) {
    StaticDiffSource source(readme_only_diff);
    ChangeCollector collector(source);
    EXPECT_THROW(collector.collect(ExclusionSet({"README.md"})), NoChangesError);
}

TEST_F(ChangeCollectorTest, EmptyDiffFailsWithNoChanges) {
    StaticDiffSource source("");
    ChangeCollector collector(source);
    EXPECT_THROW(collector.collect(ExclusionSet()), NoChangesError);
}

TEST_F(ChangeCollectorTest, SourceFailureSurfacesAsVcsUnavailable) {
    FailingDiffSource source;
    ChangeCollector collector(source);
    try {
        collector.collect(ExclusionSet());
        FAIL() << "expected VcsUnavailableError";
    } catch (const VcsUnavailableError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VcsUnavailable);
        EXPECT_EQ(exit_code_for(e.kind()), 4);
    }
}
