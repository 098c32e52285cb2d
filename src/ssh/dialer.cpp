#include "dialer.hpp"
#include "ssh_client.hpp"
#include "transport.hpp"

DefaultDialer::DefaultDialer(int connect_timeout_secs)
    : net_dial_([connect_timeout_secs](const std::string& network,
                                       const std::string& address,
                                       const Deadline& deadline) {
          return dial_tcp(network, address, deadline, connect_timeout_secs);
      }),
      client_factory_(ssh_handshake) {
}

DefaultDialer::DefaultDialer(NetDial net_dial, ClientFactory client_factory)
    : net_dial_(std::move(net_dial)), client_factory_(std::move(client_factory)) {
}

Result<ClientConn> DefaultDialer::dial(const std::string& network,
                                       const std::string& address,
                                       const ClientConfig& config,
                                       const Deadline& deadline) {
    auto transport = net_dial_(network, address, deadline);
    if (transport.is_err()) {
        return Result<ClientConn>::Err(transport.error);
    }
    if (!transport.value) {
        return Result<ClientConn>::Err("dial " + network + " " + address + ": no connection returned");
    }

    auto client = client_factory_(transport.value, config, deadline);
    if (client.is_err() || !client.value) {
        transport.value->close();
        return Result<ClientConn>::Err(client.is_err() ? client.error
                                                       : "ssh: no client returned");
    }

    ClientConn conn;
    conn.transport = transport.value;
    conn.client = client.value;
    return Result<ClientConn>::Ok(conn);
}
