#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <managers/credential_flow.hpp>

// Prompter for a human at a terminal. Passwords are read with echo off,
// key paths through readline with filename completion. EOF at any prompt
// counts as cancelling.
class TerminalPrompter : public Prompter {
public:
    std::optional<CredentialType> choose_method(const PromptContext& ctx) override;
    std::optional<std::string> request_password(const PromptContext& ctx) override;
    std::optional<std::string> request_key_path(const PromptContext& ctx) override;
    bool confirm_retry(int next_attempt, int max_attempts) override;
};
