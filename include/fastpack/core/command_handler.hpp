#pragma once

#include <string>
#include <vector>

namespace fastpack::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Uploads local files through the full chunk/confirm/finalize flow against
// the filesystem store and prints the resulting artifact id.
class PackCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Pack files into one downloadable archive"; }
    std::string get_usage() const override { return "fastpack pack <file> [file...]"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the status of an upload"; }
    std::string get_usage() const override { return "fastpack status <upload-id>"; }
};

class FetchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Copy an artifact to a local file"; }
    std::string get_usage() const override { return "fastpack fetch <artifact-id> <output>"; }
};

} // namespace fastpack::core
