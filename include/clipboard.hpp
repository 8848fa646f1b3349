#pragma once

#include <string>
#include <vector>

// Clipboard helpers tried in order: Wayland, X11, macOS.
std::vector<std::string> default_clipboard_commands();

// Pipes text into the first command that exits with status 0. Throws
// std::runtime_error when none of them does.
void copy_to_clipboard(const std::string& text,
                       const std::vector<std::string>& commands = default_clipboard_commands());
