#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

namespace filevault::password {

// Get() throws Error(InvalidInput) when no password can be produced.
class PasswordSource {
public:
    virtual ~PasswordSource() = default;

    virtual std::string Get(const std::string& account) = 0;
};

class StaticPasswordSource : public PasswordSource {
public:
    explicit StaticPasswordSource(std::string password);
    ~StaticPasswordSource() override;

    std::string Get(const std::string& account) override;

private:
    std::string password_;
};

// First line of the file; "~/" is expanded against HOME.
class FilePasswordSource : public PasswordSource {
public:
    explicit FilePasswordSource(std::string path);

    std::string Get(const std::string& account) override;
    std::filesystem::path ResolvedPath() const;

private:
    std::string path_;
};

class EnvPasswordSource : public PasswordSource {
public:
    explicit EnvPasswordSource(std::string variable);

    std::string Get(const std::string& account) override;

private:
    std::string variable_;
};

// Reads from input with terminal echo disabled when input is a TTY.
class PromptPasswordSource : public PasswordSource {
public:
    PromptPasswordSource(std::istream& input, std::ostream& prompt_out, bool confirm = false);

    std::string Get(const std::string& account) override;

private:
    std::string ReadLine(const std::string& prompt);

    std::istream& input_;
    std::ostream& prompt_out_;
    bool confirm_ = false;
};

std::filesystem::path ExpandHome(const std::string& path);

}  // namespace filevault::password
