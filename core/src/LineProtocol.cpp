#include "transmit/LineProtocol.hpp"
#include <cctype>

namespace transmit {
namespace protocol {

std::string formatStatusLine(bool ok, const std::string& message) {
    std::string flat = message;
    for (char& c : flat) {
        if (c == '\n' || c == '\r')
            c = ' ';
    }
    return std::string(ok ? "1|" : "0|") + flat;
}

std::optional<StatusLine> parseStatusLine(const std::string& line) {
    if (line.size() < 2 || line[1] != '|' || (line[0] != '0' && line[0] != '1'))
        return std::nullopt;
    StatusLine st;
    st.ok = line[0] == '1';
    st.message = line.substr(2);
    return st;
}

std::string formatProgressLine(const std::string& file, int percent) {
    return std::string(kProgressPrefix) + file + "|" + std::to_string(percent);
}

std::optional<ProgressLine> parseProgressLine(const std::string& line) {
    const std::string prefix = kProgressPrefix;
    if (line.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    const auto bar = line.find_last_of('|');
    if (bar == std::string::npos || bar < prefix.size())
        return std::nullopt;
    const std::string file = line.substr(prefix.size(), bar - prefix.size());
    const std::string digits = line.substr(bar + 1);
    if (file.empty() || digits.empty() || digits.size() > 3)
        return std::nullopt;
    int value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    if (value > 100)
        return std::nullopt;
    ProgressLine p;
    p.file = file;
    p.percent = value;
    return p;
}

bool isTerminalStatus(const std::string& line) {
    const auto st = parseStatusLine(line);
    if (!st)
        return false;
    if (!st->ok)
        return true;
    return st->message.compare(0, std::string(kUploadSucceeded).size(), kUploadSucceeded) == 0 ||
           st->message.compare(0, std::string(kRemoveSucceeded).size(), kRemoveSucceeded) == 0;
}

std::string quoteArgument(const std::string& arg) {
    bool needsQuotes = arg.empty();
    for (char c : arg) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\\') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes)
        return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string formatCommand(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty())
            out += ' ';
        out += quoteArgument(w);
    }
    return out;
}

bool splitCommand(const std::string& line, std::vector<std::string>& words) {
    words.clear();
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
            ++i;
        if (i >= line.size())
            break;
        std::string word;
        if (line[i] == '"') {
            ++i;
            bool closed = false;
            while (i < line.size()) {
                char c = line[i++];
                if (c == '\\' && i < line.size()) {
                    word += line[i++];
                } else if (c == '"') {
                    closed = true;
                    break;
                } else {
                    word += c;
                }
            }
            if (!closed)
                return false;
        } else {
            while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])))
                word += line[i++];
        }
        words.push_back(std::move(word));
    }
    return true;
}

void stripLineEnding(std::string& line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
}

} // namespace protocol
} // namespace transmit
