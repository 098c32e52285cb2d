#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

struct PoolSettings {
    int timeout_ms = 0;                     // overall open() bound, 0 = none
    int connect_timeout_secs = CONNECT_TIMEOUT_SECS; // TCP connect bound without a deadline
    std::optional<std::string> log_path;    // debug log; "" disables
};

struct HostConfig {
    std::string network = "tcp";
    std::string address;
    std::string user;
    std::string password;
    std::optional<std::string> identity_file;
    std::optional<std::string> passphrase;
};

class Config {
public:
    // Load from a YAML file
    static Result<Config> load(const fs::path& path);

    // Load ~/.sshpool/config.yaml
    static Result<Config> load_default();

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml);

    // Accessors
    const PoolSettings& pool() const { return pool_; }
    const std::map<std::string, HostConfig>& hosts() const { return hosts_; }
    const HostConfig* host(const std::string& name) const;

    // Credentials for a configured host
    Result<ClientConfig> client_config(const std::string& name) const;

public:
    Config() = default;

private:
    PoolSettings pool_;
    std::map<std::string, HostConfig> hosts_;

    static Result<Config> from_yaml(const YAML::Node& root);
};

fs::path get_default_config_path();
