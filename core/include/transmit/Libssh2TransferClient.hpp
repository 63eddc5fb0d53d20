#pragma once
#include "TransferClient.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations of libssh2's internal struct names
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace transmit {

class Libssh2TransferClient : public TransferClient {
public:
  Libssh2TransferClient();
  ~Libssh2TransferClient() override;

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }
  bool isAlive() override;

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

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool sshHandshake(const SessionOptions& opt, std::string& err);
  bool verifyHostKey(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  std::string lastSessionError() const;
};

} // namespace transmit
