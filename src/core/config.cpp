#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

fs::path get_default_config_path() {
    return platform::home_dir() / SSHPOOL_CONFIG_DIR / SSHPOOL_CONFIG_FILE;
}

static PoolSettings parse_pool_settings(const YAML::Node& node) {
    PoolSettings pool;
    pool.timeout_ms = node["timeout_ms"].as<int>(0);
    pool.connect_timeout_secs = node["connect_timeout_secs"].as<int>(CONNECT_TIMEOUT_SECS);

    if (node["log"]) {
        pool.log_path = node["log"].IsNull() ? std::string() : node["log"].as<std::string>();
    }

    return pool;
}

static Result<HostConfig> parse_host_config(const std::string& name, const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<HostConfig>::Err("Host '" + name + "' must be a mapping");
    }

    HostConfig host;
    host.network = node["network"].as<std::string>("tcp");
    host.address = node["address"].as<std::string>("");
    host.user = node["user"].as<std::string>("");
    host.password = node["password"].as<std::string>("");

    if (node["identity_file"]) {
        host.identity_file = platform::expand_home(node["identity_file"].as<std::string>()).string();
    }

    if (node["passphrase"]) {
        host.passphrase = node["passphrase"].as<std::string>();
    }

    if (host.address.empty()) {
        return Result<HostConfig>::Err("Host '" + name + "' has no address");
    }
    if (host.user.empty()) {
        return Result<HostConfig>::Err("Host '" + name + "' has no user");
    }
    return Result<HostConfig>::Ok(host);
}

Result<Config> Config::from_yaml(const YAML::Node& root) {
    if (!root.IsNull() && !root.IsMap()) {
        return Result<Config>::Err("Config root must be a mapping");
    }

    Config config;
    config.pool_ = parse_pool_settings(root["pool"] ? root["pool"] : YAML::Node());
    if (config.pool_.timeout_ms < 0) {
        return Result<Config>::Err("pool.timeout_ms must not be negative");
    }

    if (root["hosts"]) {
        if (!root["hosts"].IsMap()) {
            return Result<Config>::Err("hosts must be a mapping of name to host");
        }
        for (const auto& entry : root["hosts"]) {
            std::string name = entry.first.as<std::string>();
            auto host = parse_host_config(name, entry.second);
            if (host.is_err()) return Result<Config>::Err(host.error);
            config.hosts_[name] = host.value;
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        return from_yaml(YAML::Load(yaml));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        return from_yaml(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_default() {
    return load(get_default_config_path());
}

const HostConfig* Config::host(const std::string& name) const {
    auto it = hosts_.find(name);
    return it == hosts_.end() ? nullptr : &it->second;
}

Result<ClientConfig> Config::client_config(const std::string& name) const {
    const HostConfig* h = host(name);
    if (!h) {
        return Result<ClientConfig>::Err("Unknown host: " + name);
    }

    ClientConfig client;
    client.user = h->user;
    client.password = h->password;
    client.identity_file = h->identity_file;
    client.passphrase = h->passphrase;
    return Result<ClientConfig>::Ok(client);
}
