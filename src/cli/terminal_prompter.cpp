#include "terminal_prompter.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <readline/readline.h>
#include <readline/history.h>
#include <fmt/format.h>
#include <iostream>
#include <cstdlib>
#include <unistd.h>

static std::optional<std::string> prompt_line(const std::string& label, const std::string& default_val = "") {
    std::string suffix = default_val.empty() ? ": " : " [" + default_val + "]: ";
    std::cout << theme::color::BROWN << "    " << label << suffix << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return std::nullopt;
    trim(answer);
    if (answer.empty()) return default_val;
    return answer;
}

// Returns the chosen index, or -1 on EOF.
static int prompt_choice(const std::string& label,
                         const std::vector<std::pair<std::string, std::string>>& options,
                         int default_idx = 0) {
    std::cout << "\n" << theme::dim("    " + label) << "\n";
    for (size_t i = 0; i < options.size(); i++) {
        std::cout << theme::color::BROWN << "      "
                  << (i + 1) << theme::color::RESET << "  "
                  << options[i].first;
        if (!options[i].second.empty()) {
            std::cout << theme::dim("  " + options[i].second);
        }
        std::cout << "\n";
    }
    std::cout << theme::color::BROWN << "    Choice [" << (default_idx + 1) << "]: "
              << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return -1;
    trim(answer);
    if (answer.empty()) return default_idx;
    int n = safe_stoi(answer, 0);
    if (n >= 1 && n <= static_cast<int>(options.size())) return n - 1;
    return default_idx;
}

// nullopt on EOF or Ctrl-D at an empty prompt.
static std::optional<std::string> read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    platform::NoEchoGuard guard;
    platform::flush_stdin();    // drop type-ahead from before the prompt

    std::string password;
    // Read character by character (no echo, no canonical)
    while (true) {
        char c;
        if (read(STDIN_FILENO, &c, 1) != 1) {
            std::cout << "\n";
            return std::nullopt;
        }
        if (c == '\n' || c == '\r') break;
        if (c == 4 && password.empty()) {  // Ctrl-D
            std::cout << "\n";
            return std::nullopt;
        }
        if (c == 127 || c == 8) {  // backspace
            if (!password.empty()) password.pop_back();
            continue;
        }
        if (c == 21) {  // Ctrl-U
            password.clear();
            continue;
        }
        if (static_cast<unsigned char>(c) >= 32) password += c;
    }

    std::cout << "\n";
    return password;
}

std::optional<CredentialType> TerminalPrompter::choose_method(const PromptContext& ctx) {
    if (!ctx.last_error.empty()) std::cout << theme::fail(ctx.last_error.substr(0, ctx.last_error.find('\n')));

    std::vector<std::pair<std::string, std::string>> options = {
        {"Password", "type the account password"},
        {"SSH Key", "point at a private key file"},
    };
    int default_idx = ctx.strategy.primary_method == "publickey" ? 1 : 0;
    int idx = prompt_choice(fmt::format("Authentication for {}:", ctx.target.display()), options, default_idx);
    if (idx < 0) return std::nullopt;
    return idx == 0 ? CredentialType::Password : CredentialType::Key;
}

std::optional<std::string> TerminalPrompter::request_password(const PromptContext& ctx) {
    if (ctx.password_attempt > 1 && !ctx.last_error.empty())
        std::cout << theme::fail(ctx.last_error.substr(0, ctx.last_error.find('\n')));

    std::string prompt = fmt::format("{}    Password for {}@{} (attempt {}/{}): {}",
                                     theme::color::BROWN, ctx.target.user, ctx.target.host,
                                     ctx.password_attempt, ctx.max_password_attempts,
                                     theme::color::RESET);
    return read_password(prompt);
}

std::optional<std::string> TerminalPrompter::request_key_path(const PromptContext& ctx) {
    std::string prompt = fmt::format("    SSH key path for {} [{}]: ", ctx.target.display(),
                                     DEFAULT_KEY_PROMPT_PATH);
    rl_attempted_completion_function = nullptr;   // readline's default completes filenames
    char* raw = readline(prompt.c_str());
    if (!raw) return std::nullopt;  // EOF / Ctrl-D

    std::string path = raw;
    free(raw);
    trim(path);
    if (!path.empty()) add_history(path.c_str());
    return path.empty() ? std::string(DEFAULT_KEY_PROMPT_PATH) : path;
}

bool TerminalPrompter::confirm_retry(int next_attempt, int max_attempts) {
    auto answer = prompt_line(fmt::format("Retry connection? (Attempt {}/{}) (Y/n)", next_attempt, max_attempts), "y");
    if (!answer) return false;
    return answer->empty() || (*answer)[0] == 'y' || (*answer)[0] == 'Y';
}
