#pragma once

#include <functional>
#include <string>
#include <core/types.hpp>

// Derives the identity a pooled connection is shared under. Two calls that
// may share a connection must map to the same key, all others to different
// keys.
using KeyFunc = std::function<std::string(const std::string& network,
                                           const std::string& address,
                                           const ClientConfig& config)>;

// Default key: distinct for every combination of network, address and
// config.user. Fields are quoted so embedded separators cannot collide.
std::string addr_user_key(const std::string& network,
                          const std::string& address,
                          const ClientConfig& config);
