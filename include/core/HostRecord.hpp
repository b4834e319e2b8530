#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "core/Protocol.hpp"

namespace core {

    /**
     * A host known to the client: discovered by broadcast or entered by hand.
     * `address` is the identity (hosts are de-duplicated on it). For
     * discovered hosts it is the datagram source address; the address the
     * host advertised about itself is kept in `advertised_ip`.
     */
    struct HostRecord {
        std::string name = "Unknown Server";
        std::string address;
        std::string advertised_ip;
        uint16_t port = protocol::DEFAULT_CONTROL_PORT;
        std::string version = "1.0";
        bool pin_required = false;
        std::vector<std::string> capabilities;

        bool operator==(const HostRecord& o) const {
            return name == o.name && address == o.address && advertised_ip == o.advertised_ip &&
                   port == o.port && version == o.version && pin_required == o.pin_required &&
                   capabilities == o.capabilities;
        }
    };

    // ========== Discovery datagrams ==========

    // Host side reply: {name, ip, port, pin_required, version, capabilities}
    std::string encode_discovery_reply(const HostRecord& self);

    // Client side: parse a reply received from `source_address`.
    // Missing fields keep the HostRecord defaults; non-JSON or wrongly typed
    // fields are a ProtocolError.
    common::Result<HostRecord> parse_discovery_reply(const std::string& text,
                                                     const std::string& source_address);

    // ========== Persistence ==========

    std::string serialize_host_list(const std::vector<HostRecord>& hosts);
    common::Result<std::vector<HostRecord>> deserialize_host_list(const std::string& text);

    // "host" or "host:port"; port defaults to the control port
    common::Result<HostRecord> parse_host_endpoint(const std::string& text);

} // namespace core
