/**
 * @file prompt.cpp
 * @brief Interactive prompt implementation
 */

#include "cmdkit/core/prompt.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <algorithm>

#ifndef _WIN32
    #include <termios.h>
    #include <unistd.h>
#endif

namespace cmdkit {

namespace {

/**
 * @brief Turns terminal echo off for its lifetime.
 */
class EchoGuard {
public:
    explicit EchoGuard(bool active) {
#ifndef _WIN32
        if (active && ::tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
#else
        (void)active;
#endif
    }

    ~EchoGuard() {
#ifndef _WIN32
        if (active_) {
            ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const { return active_; }

private:
    bool active_ = false;
#ifndef _WIN32
    termios saved_{};
#endif
};

} // anonymous namespace

Value Prompter::ask(const std::string& text, const PromptOptions& options) {
    std::string label = text;
    if (options.default_value && !options.default_value->is_none()) {
        label += " [" + options.default_value->to_string() + "]";
    }

    Value first = ask_once(label, options);
    if (!options.confirm) {
        return first;
    }

    Value second = ask_once(text + " (again)", options);
    if (first != second) {
        throw PromptError("values do not match");
    }
    return first;
}

Value Prompter::ask_once(const std::string& label, const PromptOptions& options) {
    out_ << label << ": ";
    out_.flush();

    std::string line = read_line(options.hidden);

    if (line.empty()) {
        if (options.default_value) {
            return *options.default_value;
        }
        if (options.empty) {
            return Value();
        }
        throw PromptError("value required");
    }

    auto coerced = coerceText(line, options.type);
    if (!coerced) {
        throw PromptError("invalid " + std::string(valueTypeName(options.type)) + " value: '" + line + "'");
    }

    if (!options.choices.empty() &&
        std::find(options.choices.begin(), options.choices.end(), line) == options.choices.end()) {
        throw PromptError("invalid choice: '" + line + "' (choose from " +
                          utils::join(options.choices, ", ") + ")");
    }

    return *coerced;
}

std::string Prompter::read_line(bool hidden) {
    EchoGuard guard(hidden && terminal_);

    std::string line;
    if (!std::getline(in_, line)) {
        throw PromptError("no input");
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (guard.active()) {
        // The user's Enter was not echoed either.
        out_ << "\n";
    }
    LOG_TRACE("Prompter", "Read {} characters", line.size());
    return line;
}

} // namespace cmdkit
