// Newline-delimited text protocol spoken on the worker's stdin/stdout.
// Shared by the worker engine and the session orchestrator.
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace transmit {
namespace protocol {

// Startup prompts, one per line
constexpr const char* kHostnamePrompt = "Enter SSH hostname:";
constexpr const char* kUsernamePrompt = "Enter SSH username:";
constexpr const char* kAuthMethodPrompt = "Authentication method (key/password):";
constexpr const char* kPasswordPrompt = "Enter password:";
constexpr const char* kPrivateKeyPrompt = "Enter path to private key:";
constexpr const char* kConnectedMarker = "Connected to";

// Answers to the auth-method prompt
constexpr const char* kAuthMethodKey = "key";
constexpr const char* kAuthMethodPassword = "password";

// Commands
constexpr const char* kUploadCommand = "upload";
constexpr const char* kRemoveCommand = "remove";
constexpr const char* kExitCommand = "exit";

// Fixed status messages
constexpr const char* kUploadSucceeded = "Upload succeeded";
constexpr const char* kRemoveSucceeded = "Remove succeeded";
constexpr const char* kExitingShell = "Exiting shell";
constexpr const char* kUnknownCommand = "Unknown command or incorrect usage";
constexpr const char* kSessionLost = "SFTP session lost";

constexpr const char* kProgressPrefix = "PROGRESS|";

struct StatusLine {
    bool ok = false;
    std::string message;
};

struct ProgressLine {
    std::string file;
    int percent = 0;
};

// "1|msg" / "0|msg". Newlines in msg are flattened to spaces.
std::string formatStatusLine(bool ok, const std::string& message);
std::optional<StatusLine> parseStatusLine(const std::string& line);

// "PROGRESS|<file>|<0-100>"
std::string formatProgressLine(const std::string& file, int percent);
std::optional<ProgressLine> parseProgressLine(const std::string& line);

// True for the lines that complete an upload/remove command.
bool isTerminalStatus(const std::string& line);

// Commands: words separated by blanks. Words holding blanks, quotes or
// backslashes are double-quoted with backslash escapes.
std::string quoteArgument(const std::string& arg);
std::string formatCommand(const std::vector<std::string>& words);
bool splitCommand(const std::string& line, std::vector<std::string>& words);

// Drops a trailing "\n" / "\r\n".
void stripLineEnding(std::string& line);

} // namespace protocol
} // namespace transmit
