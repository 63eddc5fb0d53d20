// Abstract transfer capability. Concrete backends (libssh2, in-memory) must
// honour this API so the worker and the remote tree algorithms stay decoupled
// from the transport.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace transmit {

class TransferClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;

    virtual ~TransferClient() = default;

    // Connect, authenticate and open the SFTP subsystem
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Non-blocking liveness probe of an established session
    virtual bool isAlive() = 0;

    // Directory listing; "." and ".." are never returned
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Metadata (stat). Returns false with an empty err when the path does not exist.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Upload local file to remote (create/truncate) in fixed-size chunks
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {}) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;
};

} // namespace transmit
