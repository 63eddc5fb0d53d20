// Basic types shared between the worker, the remote tree algorithms and the
// transfer backends. Keep them plain so tests can build them inline.
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace transmit {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: records new hosts; rejects changed keys.
    Off        // No verification.
};

enum class AuthMethod { PrivateKey, Password };

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (type/permissions)
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    AuthMethod auth_method = AuthMethod::PrivateKey;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
};

} // namespace transmit
