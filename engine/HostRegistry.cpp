#include "HostRegistry.hpp"

#include <QCryptographicHash>

namespace openxfer {

HostIdentity HostIdentity::from(const HostRecord &host,
                                const Credentials &creds) {
    HostIdentity id;
    id.host = host.address;
    id.port = host.port;
    id.username = host.username;

    QCryptographicHash h(QCryptographicHash::Sha256);
    h.addData(QByteArray::number(static_cast<int>(creds.method)));
    h.addData(QByteArrayLiteral("\0"));
    switch (creds.method) {
    case AuthMethod::Password:
        h.addData(creds.password.toUtf8());
        break;
    case AuthMethod::PrivateKey:
        h.addData(creds.privateKeyPath.toUtf8());
        h.addData(QByteArrayLiteral("\0"));
        h.addData(creds.passphrase.toUtf8());
        break;
    case AuthMethod::Agent:
        break;
    }
    id.credentialFingerprint = h.result().toHex().left(16);
    return id;
}

QString HostIdentity::key() const {
    return QStringLiteral("%1:%2@%3#%4")
        .arg(host)
        .arg(port)
        .arg(username, QString::fromLatin1(credentialFingerprint));
}

QString HostIdentity::displayName() const {
    return QStringLiteral("%1:%2@%3").arg(host).arg(port).arg(username);
}

SessionOptions makeSessionOptions(const HostRecord &host,
                                  const Credentials &creds) {
    SessionOptions opt;
    opt.host = host.address.toStdString();
    opt.port = host.port;
    opt.username = host.username.toStdString();
    opt.known_hosts_policy = host.knownHostsPolicy;
    if (!host.knownHostsPath.isEmpty())
        opt.known_hosts_path = host.knownHostsPath.toStdString();
    switch (creds.method) {
    case AuthMethod::Password:
        opt.password = creds.password.toStdString();
        break;
    case AuthMethod::PrivateKey:
        opt.private_key_path = creds.privateKeyPath.toStdString();
        if (!creds.passphrase.isEmpty())
            opt.private_key_passphrase = creds.passphrase.toStdString();
        break;
    case AuthMethod::Agent:
        opt.use_agent = true;
        break;
    }
    return opt;
}

} // namespace openxfer
