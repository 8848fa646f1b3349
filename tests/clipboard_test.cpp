#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "clipboard.hpp"

namespace fs = std::filesystem;

class ClipboardTest : public ::testing::Test {
protected:
    fs::path target;

    void SetUp() override {
        target = fs::temp_directory_path() / ("commitgen_clipboard_" + std::to_string(::getpid()) + ".txt");
        fs::remove(target);
    }

    void TearDown() override {
        fs::remove(target);
    }

    std::string read_target() {
        std::ifstream in(target);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(ClipboardTest, FallsThroughToTheFirstWorkingHelper) {
    const std::string message = "feat(cli): add --copy\n\nPipes the message to the clipboard.";
    copy_to_clipboard(message, {"commitgen-no-such-helper", "false", "cat > '" + target.string() + "'"});
    EXPECT_EQ(read_target(), message);
}

TEST_F(ClipboardTest, FailsWhenNoHelperWorks) {
    EXPECT_THROW(copy_to_clipboard("fix: x", {"commitgen-no-such-helper", "false"}), std::runtime_error);
    EXPECT_THROW(copy_to_clipboard("fix: x", {}), std::runtime_error);
}

TEST(ClipboardCommandsTest, CoversWaylandX11AndMacos) {
    std::vector<std::string> commands = default_clipboard_commands();
    ASSERT_FALSE(commands.empty());
    EXPECT_EQ(commands.front(), "wl-copy");
    EXPECT_NE(std::find(commands.begin(), commands.end(), "pbcopy"), commands.end());
}
