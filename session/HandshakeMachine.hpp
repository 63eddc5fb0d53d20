// Handshake with a freshly spawned worker, modelled as a total transition
// function over (phase, output line).
#pragma once
#include "ServerConfig.hpp"
#include <QString>
#include <optional>

enum class SessionPhase {
    Disconnected,
    AwaitingHost,
    AwaitingUser,
    AwaitingCredential,
    Ready,
    Active
};

const char* sessionPhaseName(SessionPhase phase);

// Result of feeding one worker line to the machine.
struct HandshakeStep {
    SessionPhase next = SessionPhase::Disconnected;
    std::optional<QString> reply; // line to send back to the worker
    bool sensitive = false;       // reply carries a credential
    bool connected = false;       // the worker confirmed the session
};

namespace Handshake {
// Lines that are not the expected prompt of `phase` leave it unchanged and
// produce no reply.
HandshakeStep advance(SessionPhase phase, const QString& line,
                      const ServerCredentials& credentials);
} // namespace Handshake
