#include "HandshakeMachine.hpp"
#include "transmit/LineProtocol.hpp"

namespace protocol = transmit::protocol;

const char* sessionPhaseName(SessionPhase phase) {
    switch (phase) {
    case SessionPhase::Disconnected:
        return "Disconnected";
    case SessionPhase::AwaitingHost:
        return "AwaitingHost";
    case SessionPhase::AwaitingUser:
        return "AwaitingUser";
    case SessionPhase::AwaitingCredential:
        return "AwaitingCredential";
    case SessionPhase::Ready:
        return "Ready";
    case SessionPhase::Active:
        return "Active";
    }
    return "Unknown";
}

namespace Handshake {

HandshakeStep advance(SessionPhase phase, const QString& line,
                      const ServerCredentials& credentials) {
    HandshakeStep step;
    step.next = phase;
    const bool usePassword =
        credentials.authMethod == transmit::AuthMethod::Password;

    switch (phase) {
    case SessionPhase::AwaitingHost:
        if (line.contains(QLatin1String(protocol::kHostnamePrompt))) {
            step.reply = credentials.host;
            step.next = SessionPhase::AwaitingUser;
        }
        break;
    case SessionPhase::AwaitingUser:
        if (line.contains(QLatin1String(protocol::kUsernamePrompt))) {
            step.reply = credentials.username;
            step.next = SessionPhase::AwaitingCredential;
        }
        break;
    case SessionPhase::AwaitingCredential:
        if (line.contains(QLatin1String(protocol::kAuthMethodPrompt))) {
            step.reply = QString::fromLatin1(usePassword
                                                 ? protocol::kAuthMethodPassword
                                                 : protocol::kAuthMethodKey);
        } else if (!usePassword &&
                   line.contains(QLatin1String(protocol::kPrivateKeyPrompt))) {
            step.reply = credentials.identityFile;
            step.sensitive = true;
            step.next = SessionPhase::Ready;
        } else if (usePassword &&
                   line.contains(QLatin1String(protocol::kPasswordPrompt))) {
            step.reply = credentials.password;
            step.sensitive = true;
            step.next = SessionPhase::Ready;
        }
        break;
    case SessionPhase::Ready:
        if (line.startsWith(QLatin1String("1|")) &&
            line.contains(QLatin1String(protocol::kConnectedMarker))) {
            step.next = SessionPhase::Active;
            step.connected = true;
        }
        break;
    case SessionPhase::Disconnected:
    case SessionPhase::Active:
        break;
    }
    return step;
}

} // namespace Handshake
