// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and a non-blocking liveness probe.
#include "transmit/Libssh2TransferClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace transmit {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

// Context for keyboard-interactive: every prompt is answered with the password
struct KbdIntCtx {
    const char* pass;
};

static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    const char* pass = ctx ? ctx->pass : nullptr;
    const size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        if (!pass || plen == 0) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        // libssh2 frees the responses with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(plen + 1));
        if (!buf) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)plen;
    }
}

// Short description of the last SFTP status code for error messages
static std::string sftpStatusText(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE: return "failure";
        case LIBSSH2_FX_NO_CONNECTION: return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left";
        case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
        default: return "sftp status " + std::to_string(code);
    }
}

Libssh2TransferClient::Libssh2TransferClient() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2TransferClient::~Libssh2TransferClient() {
    disconnect();
}

std::string Libssh2TransferClient::lastSessionError() const {
    if (!session_) return {};
    if (sftp_ && libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        return sftpStatusText(libssh2_sftp_last_error(sftp_));
    }
    char* emsg = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsg, &emlen, 0);
    if (emsg && emlen > 0) return std::string(emsg, (size_t)emlen);
    return {};
}

bool Libssh2TransferClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive so a dead peer eventually surfaces in the liveness probe
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2TransferClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain host key";
        return false;
    }

    int alg = 0;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
            break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
            break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
            break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
            break;
#endif
        default:
            alg = 0;
            break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // The worker runs unattended: a new host is recorded without confirmation
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                           hostkey, keylen,
                                           nullptr, 0, addMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not record host in known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host unknown in known_hosts";
    return false;
}

bool Libssh2TransferClient::authenticate(const SessionOptions& opt, std::string& err) {
    if (opt.auth_method == AuthMethod::PrivateKey) {
        if (!opt.private_key_path.has_value() || opt.private_key_path->empty()) {
            err = "No private key path given";
            return false;
        }
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr, // derived from the private key
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            const std::string detail = lastSessionError();
            err = "Public key authentication failed" + (detail.empty() ? std::string() : ": " + detail);
            return false;
        }
        return true;
    }

    if (!opt.password.has_value()) {
        err = "No password given";
        return false;
    }

    int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
    if (rc_pw == 0) return true;

    // Server hung up after the password attempt: nothing else will succeed
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection after the password attempt";
        return false;
    }

    char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
    const std::string authlist = methods ? std::string(methods) : std::string();
    int rc_kbd = -1;
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
        if (abs) *abs = nullptr;
    }
    if (rc_kbd == 0) return true;

    const std::string detail = lastSessionError();
    err = std::string("Password authentication failed") +
          (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
          (detail.empty() ? std::string() : ": " + detail);
    return false;
}

bool Libssh2TransferClient::sshHandshake(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif

    // Ask libssh2 to send keepalives every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP subsystem";
        return false;
    }
    return true;
}

bool Libssh2TransferClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshake(opt, err)) {
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void Libssh2TransferClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal Shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2TransferClient::isAlive() {
    if (!connected_ || !session_ || !sftp_ || sock_ == -1) return false;

    struct pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, 0);
    if (pr < 0) return false;
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return false;
    if (pr > 0 && (pfd.revents & POLLIN)) {
        // Readable with zero bytes pending means the peer closed the socket
        char c;
        const ssize_t n = ::recv(sock_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0) return false;
    }

    int nextKeepalive = 0;
    return libssh2_keepalive_send(session_, &nextKeepalive) == 0;
}

bool Libssh2TransferClient::list(const std::string& remote_path,
                                 std::vector<FileInfo>& out,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for " + path + " (" + lastSessionError() + ")";
        return false;
    }

    out.clear();

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = attrs.permissions;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = "sftp_readdir failed for " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2TransferClient::stat(const std::string& remote_path,
                                 FileInfo& info,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            libssh2_sftp_last_error(sftp_) == LIBSSH2_FX_NO_SUCH_FILE) {
            err.clear();
            return false; // does not exist
        }
        err = "Remote stat failed for " + remote_path + " (" + lastSessionError() + ")";
        return false;
    }
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)st.filesize : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? (std::uint64_t)st.mtime : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? (std::uint32_t)st.permissions : 0;
    return true;
}

// Uploads a local file (create/truncate). Each chunk is written completely,
// retrying partial writes, before the next one is read.
bool Libssh2TransferClient::put(const std::string& local,
                                const std::string& remote,
                                std::string& err,
                                ProgressCB progress) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading: " + local;
        return false;
    }

    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing: " + remote + " (" + lastSessionError() + ")";
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    if (progress) progress(done, total);

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n > 0) {
            char* p = buf.data();
            size_t remain = n;
            while (remain > 0) {
                ssize_t w = libssh2_sftp_write(wh, p, remain);
                if (w < 0) {
                    err = "Remote write failed: " + remote + " (" + lastSessionError() + ")";
                    libssh2_sftp_close(wh);
                    std::fclose(lf);
                    return false;
                }
                remain = remain - (size_t)w;
                p = p + w;
                done = done + (size_t)w;
                if (progress) progress(done, total);
            }
        } else {
            if (std::ferror(lf)) {
                err = "Local read failed: " + local;
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return true;
}

bool Libssh2TransferClient::mkdir(const std::string& remote_dir,
                                  std::string& err,
                                  unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        err = "sftp_mkdir failed for " + remote_dir + " (" + lastSessionError() + ")";
        return false;
    }
    return true;
}

bool Libssh2TransferClient::removeFile(const std::string& remote_path,
                                       std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        err = "sftp_unlink failed for " + remote_path + " (" + lastSessionError() + ")";
        return false;
    }
    return true;
}

bool Libssh2TransferClient::removeDir(const std::string& remote_dir,
                                      std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    int rc = libssh2_sftp_rmdir(sftp_, remote_dir.c_str());
    if (rc != 0) {
        err = "sftp_rmdir failed for " + remote_dir + " (" + lastSessionError() + ")";
        return false;
    }
    return true;
}

} // namespace transmit
