#include "transmit/MemoryTransferClient.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace transmit {

MemoryTransferClient::MemoryTransferClient() {
  Node root;
  root.is_dir = true;
  root.mode = 0755;
  fs_["/"] = root;
}

std::string MemoryTransferClient::normalize(const std::string& path) {
  std::string out = "/";
  std::size_t i = 0;
  while (i < path.size()) {
    while (i < path.size() && path[i] == '/') ++i;
    std::size_t j = i;
    while (j < path.size() && path[j] != '/') ++j;
    if (j > i) {
      const std::string seg = path.substr(i, j - i);
      if (seg != ".") {
        if (out.size() > 1) out += '/';
        out += seg;
      }
    }
    i = j;
  }
  return out;
}

std::string MemoryTransferClient::parentOf(const std::string& path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return "/";
  return path.substr(0, slash);
}

bool MemoryTransferClient::hasChildren(const std::string& path) const {
  const std::string prefix = path == "/" ? "/" : path + "/";
  auto it = fs_.lower_bound(prefix);
  if (it != fs_.end() && it->first == path) ++it;
  return it != fs_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

bool MemoryTransferClient::connect(const SessionOptions& opt, std::string& err) {
  if (opt.host.empty() || opt.username.empty()) {
    err = "Host and username are required";
    return false;
  }
  if (acceptedCredential_) {
    const std::string given = opt.auth_method == AuthMethod::Password
                                  ? opt.password.value_or(std::string())
                                  : opt.private_key_path.value_or(std::string());
    if (given != *acceptedCredential_) {
      err = "Authentication failed";
      return false;
    }
  }
  connected_ = true;
  sessionLost_ = false;
  lastOpt_ = opt;
  return true;
}

void MemoryTransferClient::disconnect() {
  connected_ = false;
}

bool MemoryTransferClient::list(const std::string& remote_path,
                                std::vector<FileInfo>& out,
                                std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  auto it = fs_.find(path);
  if (it == fs_.end() || !it->second.is_dir) {
    err = "Cannot open directory: " + path;
    return false;
  }

  out.clear();
  const std::string prefix = path == "/" ? "/" : path + "/";
  for (auto c = fs_.lower_bound(prefix); c != fs_.end(); ++c) {
    if (c->first.compare(0, prefix.size(), prefix) != 0) break;
    const std::string rest = c->first.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string::npos) continue;
    FileInfo fi;
    fi.name = rest;
    fi.is_dir = c->second.is_dir;
    fi.size = c->second.content.size();
    fi.mode = c->second.mode;
    out.push_back(std::move(fi));
  }
  std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b){
    if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // dirs first
    return a.name < b.name;
  });
  return true;
}

bool MemoryTransferClient::stat(const std::string& remote_path,
                                FileInfo& info,
                                std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  auto it = fs_.find(path);
  if (it == fs_.end()) {
    err.clear();
    return false;
  }
  const auto slash = path.find_last_of('/');
  info.name = path.substr(slash + 1);
  info.is_dir = it->second.is_dir;
  info.size = it->second.content.size();
  info.mode = it->second.mode;
  return true;
}

bool MemoryTransferClient::put(const std::string& local,
                               const std::string& remote,
                               std::string& err,
                               ProgressCB progress) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  std::ifstream in(local, std::ios::binary);
  if (!in.is_open()) {
    err = "Could not open local file for reading: " + local;
    return false;
  }
  const std::string path = normalize(remote);
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "Could not open remote file for writing: " + path + " (no such file)";
    return false;
  }
  auto existing = fs_.find(path);
  if (existing != fs_.end() && existing->second.is_dir) {
    err = "Could not open remote file for writing: " + path + " (failure)";
    return false;
  }

  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  const std::size_t CHUNK = 64 * 1024;
  const std::size_t total = data.size();
  if (progress) progress(0, total);
  Node node;
  node.mode = 0644;
  for (std::size_t done = 0; done < total;) {
    const std::size_t n = std::min(CHUNK, total - done);
    node.content.append(data, done, n);
    done += n;
    if (progress) progress(done, total);
  }
  fs_[path] = node;
  return true;
}

bool MemoryTransferClient::mkdir(const std::string& remote_dir,
                                 std::string& err,
                                 unsigned int mode) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_dir);
  if (fs_.count(path)) {
    err = "sftp_mkdir failed for " + path + " (file already exists)";
    return false;
  }
  auto parent = fs_.find(parentOf(path));
  if (parent == fs_.end() || !parent->second.is_dir) {
    err = "sftp_mkdir failed for " + path + " (no such file)";
    return false;
  }
  Node node;
  node.is_dir = true;
  node.mode = mode;
  fs_[path] = node;
  return true;
}

bool MemoryTransferClient::removeFile(const std::string& remote_path,
                                      std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_path);
  auto it = fs_.find(path);
  if (it == fs_.end() || it->second.is_dir || removalFailures_.count(path)) {
    err = "sftp_unlink failed for " + path;
    return false;
  }
  fs_.erase(it);
  return true;
}

bool MemoryTransferClient::removeDir(const std::string& remote_dir,
                                     std::string& err) {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  const std::string path = normalize(remote_dir);
  auto it = fs_.find(path);
  if (path == "/" || it == fs_.end() || !it->second.is_dir ||
      hasChildren(path) || removalFailures_.count(path)) {
    err = "sftp_rmdir failed for " + path;
    return false;
  }
  fs_.erase(it);
  return true;
}

void MemoryTransferClient::addDirectory(const std::string& path) {
  const std::string p = normalize(path);
  if (p != "/") addDirectory(parentOf(p));
  Node& node = fs_[p];
  node.is_dir = true;
  node.mode = 0755;
}

void MemoryTransferClient::addFile(const std::string& path, const std::string& content) {
  const std::string p = normalize(path);
  addDirectory(parentOf(p));
  Node node;
  node.content = content;
  node.mode = 0644;
  fs_[p] = node;
}

bool MemoryTransferClient::exists(const std::string& path) const {
  return fs_.count(normalize(path)) > 0;
}

bool MemoryTransferClient::isDirectory(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it != fs_.end() && it->second.is_dir;
}

std::optional<std::string> MemoryTransferClient::fileContent(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  if (it == fs_.end() || it->second.is_dir) return std::nullopt;
  return it->second.content;
}

std::vector<std::string> MemoryTransferClient::paths() const {
  std::vector<std::string> out;
  out.reserve(fs_.size());
  for (const auto& kv : fs_) out.push_back(kv.first);
  return out;
}

void MemoryTransferClient::failRemovalOf(const std::string& path) {
  removalFailures_.insert(normalize(path));
}

} // namespace transmit
