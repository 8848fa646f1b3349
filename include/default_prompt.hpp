#pragma once

#include "commit_message.hpp"
#include <string>

// Instruction block sent ahead of every diff, listing the policy's types and
// limits.
std::string default_llm_instructions(const CommitPolicy& policy);
