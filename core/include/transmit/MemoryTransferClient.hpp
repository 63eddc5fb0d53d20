#pragma once
#include "TransferClient.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace transmit {

// In-memory remote tree honouring the TransferClient contract. Used by the
// unit tests and by the test worker executable.
class MemoryTransferClient : public TransferClient {
public:
  MemoryTransferClient();

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }
  bool isAlive() override { return connected_ && !sessionLost_; }

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

  bool put(const std::string& local,
           const std::string& remote,
           std::string& err,
           ProgressCB progress = {}) override;

  bool mkdir(const std::string& remote_dir,
             std::string& err,
             unsigned int mode = 0755) override;

  bool removeFile(const std::string& remote_path,
                  std::string& err) override;

  bool removeDir(const std::string& remote_dir,
                 std::string& err) override;

  // Seeding and inspection (parents are created as needed)
  void addDirectory(const std::string& path);
  void addFile(const std::string& path, const std::string& content);
  bool exists(const std::string& path) const;
  bool isDirectory(const std::string& path) const;
  std::optional<std::string> fileContent(const std::string& path) const;
  std::vector<std::string> paths() const;

  // Failure injection
  void setAcceptedCredential(const std::string& credential) { acceptedCredential_ = credential; }
  void failRemovalOf(const std::string& path);
  void simulateSessionLoss() { sessionLost_ = true; }

  const SessionOptions& lastOptions() const { return lastOpt_; }

private:
  struct Node {
    bool is_dir = false;
    std::string content;
    std::uint32_t mode = 0;
  };

  bool connected_ = false;
  bool sessionLost_ = false;
  SessionOptions lastOpt_{};
  std::optional<std::string> acceptedCredential_;
  std::set<std::string> removalFailures_;

  // normalized absolute path -> node; "/" always exists
  std::map<std::string, Node> fs_;

  static std::string normalize(const std::string& path);
  static std::string parentOf(const std::string& path);
  bool hasChildren(const std::string& path) const;
};

} // namespace transmit
