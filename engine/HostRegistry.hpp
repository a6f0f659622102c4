// Read-only collaborators the engine consults before opening a session:
// where a host lives and how to authenticate against it.
#pragma once
#include "openxfer/SftpTypes.hpp"
#include <QByteArray>
#include <QString>
#include <optional>

namespace openxfer {

struct HostRecord {
    QString id;
    QString address;
    quint16 port = 22;
    QString username;
    QString defaultRemotePath;
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Strict;
    QString knownHostsPath; // empty: ~/.ssh/known_hosts
};

enum class AuthMethod { Password, PrivateKey, Agent };

struct Credentials {
    AuthMethod method = AuthMethod::Password;
    QString password;
    QString privateKeyPath;
    QString passphrase;
};

class HostRegistry {
public:
    virtual ~HostRegistry() = default;
    virtual std::optional<HostRecord> findHost(const QString &hostId) const = 0;
};

// Secrets handed out here are used to build session options only; the
// engine never stores or logs them.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;
    virtual std::optional<Credentials>
    credentialsFor(const QString &hostId) const = 0;
};

// Pool key: two identities are equal only when host, port, principal and
// credential material all match.
struct HostIdentity {
    QString host;
    quint16 port = 22;
    QString username;
    QByteArray credentialFingerprint; // SHA-256 of the auth descriptor

    static HostIdentity from(const HostRecord &host, const Credentials &creds);

    QString key() const;
    // host:port@user without the fingerprint, for logs.
    QString displayName() const;

    bool operator==(const HostIdentity &o) const { return key() == o.key(); }
    bool operator!=(const HostIdentity &o) const { return !(*this == o); }
};

SessionOptions makeSessionOptions(const HostRecord &host,
                                  const Credentials &creds);

} // namespace openxfer
