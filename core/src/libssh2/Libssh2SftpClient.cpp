// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Handles keepalive, known_hosts validation, resumable and ranged transfers.
#include "openxfer/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace openxfer {

namespace {

constexpr std::size_t kBlockSize = 64 * 1024;

std::once_flag g_libssh2_init;

// Keyboard-interactive context: answers user or password depending on the
// prompt text unless a caller callback handles the prompts.
struct KbdIntCtx {
    const char *user;
    const char *pass;
    const KbdIntPromptsCB *cb;
};

void fillResponse(LIBSSH2_USERAUTH_KBDINT_RESPONSE &r, const char *src,
                  std::size_t len) {
    r.text = nullptr;
    r.length = 0;
    if (!src || len == 0)
        return;
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return;
    std::memcpy(buf, src, len);
    buf[len] = '\0';
    r.text = buf;
    r.length = static_cast<unsigned int>(len);
}

void kbintCallback(const char *name, int name_len, const char *instruction,
                   int instruction_len, int num_prompts,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                   void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve(static_cast<std::size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char *pt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
            texts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        const std::string nm =
            (name && name_len > 0) ? std::string(name, (std::size_t)name_len)
                                   : std::string();
        const std::string ins =
            (instruction && instruction_len > 0)
                ? std::string(instruction, (std::size_t)instruction_len)
                : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) &&
            static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string &a = answers[(std::size_t)i];
                fillResponse(responses[i], a.data(), a.size());
            }
            return;
        }
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        fillResponse(responses[i], ans, ans ? std::strlen(ans) : 0);
    }
}

int knownHostKeyType(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char *hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

std::string shellQuote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

bool isHexDigest(const std::string &s, std::size_t len) {
    if (s.size() != len)
        return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, [] { libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::tcpConnect(const std::string &host, uint16_t port,
                                   std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
        ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
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
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port";
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read server host key";
        return false;
    }

    const int alg = knownHostKeyType(keytype);
    const int plainMask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int hashMask =
        LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost *entry = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, plainMask, &entry);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, hashMask, &entry);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fingerprint;
        const unsigned char *h = reinterpret_cast<const unsigned char *>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << (i ? ":" : "") << b;
            }
            fingerprint = oss.str();
        }
        const bool confirmed =
            opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port,
                                   hostKeyAlgorithmName(keytype), fingerprint);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addrc = libssh2_knownhost_addc(
            nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            plainMask, nullptr);
        const bool written =
            addrc == 0 && libssh2_knownhost_writefile(
                              nh, khPath.c_str(),
                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!written) {
            err = "Could not record host in known_hosts";
            return false;
        }
        return true;
    }

    libssh2_knownhost_free(nh);
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                  ? "Host key does not match known_hosts"
                  : "Host not present in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::agentAuth(const std::string &user) {
    bool authed = false;
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Explicit key first, then password (falling back to keyboard-interactive
// when the server offers it), then ssh-agent.
bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     std::string &err) {
    const std::string &user = opt.username;
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        if (libssh2_userauth_publickey_fromfile(session_, user.c_str(),
                                                nullptr,
                                                opt.private_key_path->c_str(),
                                                passphrase) == 0)
            return true;
        err = "Public key authentication failed";
        noteFailure(err);
        return false;
    }

    char *methods =
        libssh2_userauth_list(session_, user.c_str(), (unsigned)user.size());
    if (!methods && libssh2_userauth_authenticated(session_))
        return true;
    const std::string authlist = methods ? methods : "";
    auto offers = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };

    if (opt.password.has_value()) {
        int rc = libssh2_userauth_password(session_, user.c_str(),
                                           opt.password->c_str());
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after password attempt";
            return false;
        }
        if (offers("keyboard-interactive")) {
            KbdIntCtx ctx{user.c_str(), opt.password->c_str(),
                          &opt.keyboard_interactive_cb};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                       kbintCallback);
            if (abs)
                *abs = nullptr;
            if (rc == 0)
                return true;
        }
    }

    if ((opt.use_agent || !opt.password.has_value()) && offers("publickey") &&
        agentAuth(user))
        return true;

    err = opt.password.has_value() ? "Password authentication failed"
                                   : "No usable credentials (key/agent/password)";
    if (!authlist.empty())
        err += " (server methods: " + authlist + ")";
    noteFailure(err);
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    if (opt.connect_timeout_ms > 0)
        libssh2_session_set_timeout(session_, opt.connect_timeout_ms);
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        disconnect();
        return false;
    }
    // Ask libssh2 to send keepalives every 30s when the peer allows it.
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not start the SFTP subsystem";
        disconnect();
        return false;
    }
    // Transfers may legitimately block longer than the handshake.
    libssh2_session_set_timeout(session_, 0);
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int s = sock_.exchange(-1);
    if (s != -1)
        ::close(s);
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    const int s = sock_.load();
    if (s != -1)
        ::shutdown(s, SHUT_RDWR);
    connected_ = false;
}

bool Libssh2SftpClient::ready(std::string &err) const {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

void Libssh2SftpClient::noteFailure(std::string &err) {
    if (!session_)
        return;
    char *msg = nullptr;
    int len = 0;
    const int code = libssh2_session_last_error(session_, &msg, &len, 0);
    if (msg && len > 0)
        err += std::string(": ") + std::string(msg, (std::size_t)len);
    switch (code) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
        connected_ = false;
        break;
    default:
        break;
    }
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<FileInfo> &out, std::string &err) {
    if (!ready(err))
        return false;
    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for " + path;
        noteFailure(err);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry),
                                               &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err = "sftp_readdir_ex failed";
            noteFailure(err);
            libssh2_sftp_closedir(dir);
            return false;
        }
        FileInfo fi{};
        fi.name = std::string(filename, (std::size_t)rc);
        if (fi.name == "." || fi.name == "..")
            continue;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            fi.mode = attrs.permissions;
            fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                        LIBSSH2_SFTP_S_IFDIR;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
            fi.has_size = true;
            fi.size = attrs.filesize;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            fi.mtime = attrs.mtime;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
            fi.uid = attrs.uid;
            fi.gid = attrs.gid;
        }
        out.push_back(std::move(fi));
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::get(const std::string &remote,
                            const std::string &local, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel,
                            bool resume) {
    if (!ready(err))
        return false;

    FileInfo st;
    std::string serr;
    if (!stat(remote, st, serr)) {
        err = serr.empty() ? "Remote file not found: " + remote : serr;
        return false;
    }
    const std::uint64_t total = st.size;

    LIBSSH2_SFTP_HANDLE *rh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading";
        noteFailure(err);
        return false;
    }

    FILE *lf = nullptr;
    std::uint64_t offset = 0;
    if (resume) {
        lf = std::fopen(local.c_str(), "ab");
        if (lf) {
            const off_t cur = ::ftello(lf);
            if (cur > 0 && (std::uint64_t)cur <= total) {
                offset = (std::uint64_t)cur;
                libssh2_sftp_seek64(rh, offset);
            } else if (cur > 0) {
                // Local file is larger than the source: restart.
                std::fclose(lf);
                lf = nullptr;
            }
        }
    }
    if (!lf)
        lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing";
        return false;
    }

    std::vector<char> buf(kBlockSize);
    std::uint64_t done = offset;
    bool ok = true;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            ok = false;
            break;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            err = "Remote read failed";
            noteFailure(err);
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, (std::size_t)n, lf) != (std::size_t)n) {
            err = "Local write failed";
            ok = false;
            break;
        }
        done += (std::uint64_t)n;
        if (progress)
            progress(done, total);
    }
    std::fclose(lf);
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2SftpClient::put(const std::string &local,
                            const std::string &remote, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel,
                            bool resume) {
    if (!ready(err))
        return false;

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    ::fseeko(lf, 0, SEEK_END);
    const off_t fsz = ::ftello(lf);
    ::fseeko(lf, 0, SEEK_SET);
    const std::uint64_t total = fsz > 0 ? (std::uint64_t)fsz : 0;

    std::uint64_t startOffset = 0;
    if (resume) {
        FileInfo st;
        std::string serr;
        if (stat(remote, st, serr) && st.size <= total)
            startOffset = st.size;
    }
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                                (startOffset > 0 ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE *wh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing";
        noteFailure(err);
        return false;
    }

    std::uint64_t done = 0;
    if (startOffset > 0) {
        libssh2_sftp_seek64(wh, startOffset);
        if (::fseeko(lf, (off_t)startOffset, SEEK_SET) != 0) {
            err = "Could not seek local file";
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return false;
        }
        done = startOffset;
    }

    std::vector<char> buf(kBlockSize);
    bool ok = true;
    while (ok) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed";
                ok = false;
            }
            break;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = "Canceled by user";
                ok = false;
                break;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed";
                noteFailure(err);
                ok = false;
                break;
            }
            remain -= (std::size_t)w;
            p += w;
            done += (std::uint64_t)w;
            if (progress)
                progress(done, total);
        }
    }
    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

bool Libssh2SftpClient::getRange(const std::string &remote,
                                 const std::string &local, std::uint64_t offset,
                                 std::uint64_t length, std::string &err,
                                 ProgressCB progress, CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_HANDLE *rh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading";
        noteFailure(err);
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "r+b");
    if (!lf || ::fseeko(lf, (off_t)offset, SEEK_SET) != 0) {
        if (lf)
            std::fclose(lf);
        libssh2_sftp_close(rh);
        err = "Could not open local file for ranged write";
        return false;
    }
    libssh2_sftp_seek64(rh, offset);

    std::vector<char> buf(kBlockSize);
    std::uint64_t done = 0;
    bool ok = true;
    while (done < length) {
        if (shouldCancel && shouldCancel()) {
            err = "Canceled by user";
            ok = false;
            break;
        }
        const std::size_t want =
            (std::size_t)std::min<std::uint64_t>(buf.size(), length - done);
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), want);
        if (n <= 0) {
            err = n == 0 ? "Unexpected end of remote file" : "Remote read failed";
            if (n < 0)
                noteFailure(err);
            ok = false;
            break;
        }
        if (std::fwrite(buf.data(), 1, (std::size_t)n, lf) != (std::size_t)n) {
            err = "Local write failed";
            ok = false;
            break;
        }
        done += (std::uint64_t)n;
        if (progress)
            progress(done, length);
    }
    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed";
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

bool Libssh2SftpClient::putRange(const std::string &local,
                                 const std::string &remote, std::uint64_t offset,
                                 std::uint64_t length, std::string &err,
                                 ProgressCB progress, CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf || ::fseeko(lf, (off_t)offset, SEEK_SET) != 0) {
        if (lf)
            std::fclose(lf);
        err = "Could not open local file for reading";
        return false;
    }
    LIBSSH2_SFTP_HANDLE *wh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_FXF_WRITE, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for ranged write";
        noteFailure(err);
        return false;
    }
    libssh2_sftp_seek64(wh, offset);

    std::vector<char> buf(kBlockSize);
    std::uint64_t done = 0;
    bool ok = true;
    while (ok && done < length) {
        const std::size_t want =
            (std::size_t)std::min<std::uint64_t>(buf.size(), length - done);
        const std::size_t n = std::fread(buf.data(), 1, want, lf);
        if (n != want) {
            err = "Local read failed";
            ok = false;
            break;
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = "Canceled by user";
                ok = false;
                break;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed";
                noteFailure(err);
                ok = false;
                break;
            }
            remain -= (std::size_t)w;
            p += w;
            done += (std::uint64_t)w;
            if (progress)
                progress(done, length);
        }
    }
    libssh2_sftp_close(wh);
    std::fclose(lf);
    return ok;
}

bool Libssh2SftpClient::allocate(const std::string &remote, std::uint64_t size,
                                 std::string &err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "Could not create remote file";
        noteFailure(err);
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_SIZE;
    a.filesize = size;
    const int rc = libssh2_sftp_fsetstat(wh, &a);
    libssh2_sftp_close(wh);
    if (rc != 0) {
        err = "Could not set remote file size";
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::exists(const std::string &remote_path, bool &isDir,
                               std::string &err) {
    isDir = false;
    FileInfo info;
    if (!stat(remote_path, info, err))
        return false;
    isDir = info.is_dir;
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, FileInfo &info,
                             std::string &err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc =
        libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             (unsigned)remote_path.size(), LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
            (sftpErr == LIBSSH2_FX_NO_SUCH_FILE ||
             sftpErr == LIBSSH2_FX_NO_SUCH_PATH)) {
            err.clear();
            return false;
        }
        err = "Remote stat failed";
        noteFailure(err);
        return false;
    }
    info = FileInfo{};
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path
                                           : remote_path.substr(slash + 1);
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.mode = st.permissions;
        info.is_dir =
            (st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        info.has_size = true;
        info.size = st.filesize;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        info.mtime = st.mtime;
    if (st.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        info.uid = st.uid;
        info.gid = st.gid;
    }
    return true;
}

bool Libssh2SftpClient::chmod(const std::string &remote_path,
                              std::uint32_t mode, std::string &err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode;
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             (unsigned)remote_path.size(), LIBSSH2_SFTP_SETSTAT,
                             &a) != 0) {
        err = "Remote chmod failed";
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::setTimes(const std::string &remote_path,
                                 std::uint64_t atime, std::uint64_t mtime,
                                 std::string &err) {
    if (!ready(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = (unsigned long)atime;
    a.mtime = (unsigned long)mtime;
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                             (unsigned)remote_path.size(), LIBSSH2_SFTP_SETSTAT,
                             &a) != 0) {
        err = "Remote setTimes failed";
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, std::string &err,
                              unsigned int mode) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = "sftp_mkdir failed for " + remote_dir;
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &remote_path,
                                   std::string &err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = "sftp_unlink failed for " + remote_path;
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &remote_dir,
                                  std::string &err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = "sftp_rmdir failed (directory not empty?) for " + remote_dir;
        noteFailure(err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               std::string &err, bool overwrite) {
    if (!ready(err))
        return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    if (libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                               to.c_str(), (unsigned)to.size(), flags) != 0) {
        err = "sftp_rename_ex failed";
        noteFailure(err);
        return false;
    }
    return true;
}

// Runs sha256sum/md5sum (or the BSD shasum/md5 equivalents) over an exec
// channel and parses the leading hex digest.
bool Libssh2SftpClient::checksum(const std::string &remote_path,
                                 ChecksumAlgorithm algorithm,
                                 std::string &hexOut, std::string &err) {
    if (!ready(err))
        return false;
    const std::string q = shellQuote(remote_path);
    const bool sha = algorithm == ChecksumAlgorithm::Sha256;
    const std::string cmd =
        sha ? "sha256sum -- " + q + " 2>/dev/null || shasum -a 256 " + q
            : "md5sum -- " + q + " 2>/dev/null || md5 -r " + q;
    const std::size_t digestLen = sha ? 64 : 32;

    LIBSSH2_CHANNEL *ch = libssh2_channel_open_session(session_);
    if (!ch) {
        err = "Could not open exec channel";
        noteFailure(err);
        return false;
    }
    if (libssh2_channel_exec(ch, cmd.c_str()) != 0) {
        err = "Remote checksum command could not be started";
        noteFailure(err);
        libssh2_channel_free(ch);
        return false;
    }
    std::string output;
    char buf[512];
    while (true) {
        const ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, (std::size_t)n);
            continue;
        }
        if (n < 0) {
            err = "Reading remote checksum output failed";
            noteFailure(err);
            libssh2_channel_free(ch);
            return false;
        }
        break;
    }
    libssh2_channel_close(ch);
    libssh2_channel_wait_closed(ch);
    const int status = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);

    const std::string digest = output.substr(0, output.find_first_of(" \t\r\n"));
    if (status != 0 || !isHexDigest(digest, digestLen)) {
        err = "Remote checksum unavailable for " + remote_path;
        return false;
    }
    hexOut.clear();
    for (char c : digest)
        hexOut += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return true;
}

std::unique_ptr<SftpClient>
Libssh2SftpClient::newConnectionLike(const SessionOptions &opt,
                                     std::string &err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace openxfer
