#include "key.hpp"
#include <core/utils.hpp>

std::string addr_user_key(const std::string& network,
                          const std::string& address,
                          const ClientConfig& config) {
    return quote(network) + " " + quote(address) + " " + quote(config.user);
}
