#include "filevault/password_source.hpp"

#include "filevault/crypto.hpp"
#include "filevault/env.hpp"
#include "filevault/error.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <utility>

#include <termios.h>
#include <unistd.h>

namespace filevault::password {

namespace {

void StripLineEnding(std::string& line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
}

// Restores the terminal mode on scope exit.
class EchoGuard {
public:
    explicit EchoGuard(int fd) : fd_(fd) {
        if (isatty(fd_) && tcgetattr(fd_, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
            active_ = tcsetattr(fd_, TCSAFLUSH, &silent) == 0;
        }
    }
    ~EchoGuard() {
        if (active_) {
            tcsetattr(fd_, TCSAFLUSH, &saved_);
        }
    }
    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const noexcept { return active_; }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

}  // namespace

std::filesystem::path ExpandHome(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        std::string home = filevault::env::HomeDir();
        if (!home.empty()) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return std::filesystem::path(path);
}

StaticPasswordSource::StaticPasswordSource(std::string password) : password_(std::move(password)) {}

StaticPasswordSource::~StaticPasswordSource() {
    crypto::SecureWipe(password_);
}

std::string StaticPasswordSource::Get(const std::string& account) {
    if (password_.empty()) {
        throw Error(ErrorCode::InvalidInput, "No password available for " + account);
    }
    return password_;
}

FilePasswordSource::FilePasswordSource(std::string path) : path_(std::move(path)) {}

std::filesystem::path FilePasswordSource::ResolvedPath() const {
    return ExpandHome(path_);
}

std::string FilePasswordSource::Get(const std::string& account) {
    std::filesystem::path resolved = ResolvedPath();
    std::ifstream input(resolved, std::ios::binary);
    if (!input) {
        throw Error(ErrorCode::InvalidInput, "Cannot read password file " + resolved.string());
    }
    std::string line;
    std::getline(input, line);
    if (input.bad()) {
        throw Error(ErrorCode::InvalidInput, "Cannot read password file " + resolved.string());
    }
    StripLineEnding(line);
    if (line.empty()) {
        throw Error(ErrorCode::InvalidInput, "Password file for " + account + " is empty");
    }
    return line;
}

EnvPasswordSource::EnvPasswordSource(std::string variable) : variable_(std::move(variable)) {}

std::string EnvPasswordSource::Get(const std::string& account) {
    std::string value = filevault::env::Get(variable_);
    if (value.empty()) {
        throw Error(ErrorCode::InvalidInput, "Environment variable " + variable_ + " is not set (" + account + ")");
    }
    return value;
}

PromptPasswordSource::PromptPasswordSource(std::istream& input, std::ostream& prompt_out, bool confirm)
    : input_(input),
      prompt_out_(prompt_out),
      confirm_(confirm) {}

std::string PromptPasswordSource::ReadLine(const std::string& prompt) {
    prompt_out_ << prompt << std::flush;
    std::string line;
    {
        std::unique_ptr<EchoGuard> guard;
        if (&input_ == &std::cin) {
            guard = std::make_unique<EchoGuard>(fileno(stdin));
        }
        std::getline(input_, line);
        if (guard && guard->active()) {
            prompt_out_ << "\n";
        }
    }
    if (input_.bad() || (input_.fail() && line.empty())) {
        throw Error(ErrorCode::InvalidInput, "No password entered");
    }
    StripLineEnding(line);
    return line;
}

std::string PromptPasswordSource::Get(const std::string& account) {
    std::string password = ReadLine("Password for " + account + ": ");
    if (password.empty()) {
        throw Error(ErrorCode::InvalidInput, "Password must not be empty");
    }
    if (confirm_) {
        std::string again = ReadLine("Confirm password: ");
        bool match = again == password;
        crypto::SecureWipe(again);
        if (!match) {
            crypto::SecureWipe(password);
            throw Error(ErrorCode::InvalidInput, "Passwords do not match");
        }
    }
    return password;
}

}  // namespace filevault::password
