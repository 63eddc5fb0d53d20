// Recursive remote-filesystem helpers built on the TransferClient primitives.
#pragma once
#include "TransferClient.hpp"
#include <string>

namespace transmit {

// Deepest directory nesting remove-path-recursive will descend into.
constexpr int kMaxRemoveDepth = 64;

// Permissions used for every directory created by ensureDirectoryChain.
constexpr unsigned int kDirectoryMode = 0755;

// Creates every missing directory of `path`, left to right. Existing
// directories are accepted; an existing non-directory anywhere on the chain
// fails and `err` names the colliding prefix.
bool ensureDirectoryChain(TransferClient& client, const std::string& path,
                          std::string& err);

// Post-order depth-first delete of a file or directory tree. A path that does
// not exist counts as removed. The first failing child aborts the walk and
// `err` names it.
bool removePathRecursive(TransferClient& client, const std::string& path,
                         std::string& err, int depth = 0);

// Path helpers for '/'-separated remote paths.
std::string joinRemotePath(const std::string& base, const std::string& name);
std::string remoteParentPath(const std::string& path);

} // namespace transmit
