#include "transmit/RemoteTree.hpp"
#include <vector>

namespace transmit {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string remoteParentPath(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto slash = p.find_last_of('/');
    if (slash == std::string::npos)
        return {};
    if (slash == 0)
        return "/";
    return p.substr(0, slash);
}

bool ensureDirectoryChain(TransferClient& client, const std::string& path,
                          std::string& err) {
    if (path.empty() || path == "/")
        return true;

    FileInfo info;
    std::string statErr;
    if (client.stat(path, info, statErr) && info.is_dir)
        return true;

    // Walk the prefixes; a leading '/' keeps the chain absolute
    std::string current = path.front() == '/' ? "/" : "";
    std::size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/')
            ++i;
        std::size_t j = i;
        while (j < path.size() && path[j] != '/')
            ++j;
        if (j == i)
            break;
        current = joinRemotePath(current, path.substr(i, j - i));
        i = j;

        FileInfo part;
        statErr.clear();
        if (client.stat(current, part, statErr)) {
            if (!part.is_dir) {
                err = "Path exists and is not a directory: " + current;
                return false;
            }
            continue;
        }
        if (!statErr.empty()) {
            err = statErr;
            return false;
        }
        std::string mkErr;
        if (!client.mkdir(current, mkErr, kDirectoryMode)) {
            err = "Failed to create directory: " + current +
                  (mkErr.empty() ? std::string() : " (" + mkErr + ")");
            return false;
        }
    }
    return true;
}

bool removePathRecursive(TransferClient& client, const std::string& path,
                         std::string& err, int depth) {
    if (depth > kMaxRemoveDepth) {
        err = "Maximum directory depth exceeded at: " + path;
        return false;
    }

    FileInfo info;
    std::string statErr;
    if (!client.stat(path, info, statErr) && statErr.empty())
        return true; // nothing to remove

    std::string opErr;
    if (client.removeFile(path, opErr))
        return true;

    std::vector<FileInfo> entries;
    if (!client.list(path, entries, opErr)) {
        if (client.removeDir(path, opErr))
            return true;
        err = "Failed to open or remove path: " + path;
        return false;
    }

    for (const auto& entry : entries) {
        if (entry.name == "." || entry.name == "..")
            continue;
        const std::string child = joinRemotePath(path, entry.name);
        if (entry.is_dir) {
            if (!removePathRecursive(client, child, err, depth + 1))
                return false;
        } else if (!client.removeFile(child, opErr)) {
            err = "Failed to delete file: " + child;
            return false;
        }
    }

    if (!client.removeDir(path, opErr)) {
        err = "Failed to remove directory: " + path;
        return false;
    }
    return true;
}

} // namespace transmit
