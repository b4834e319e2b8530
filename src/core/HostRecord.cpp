#include "core/HostRecord.hpp"
#include <nlohmann/json.hpp>

namespace core {

    using nlohmann::json;

    namespace {

        common::Result<HostRecord> record_error(const std::string& msg) {
            return common::Result<HostRecord>::err(common::ErrorCode::ProtocolError, msg);
        }

        // Fills the optional metadata fields shared by discovery replies and
        // the persisted list. Returns an empty string on success.
        std::string read_metadata(const json& j, HostRecord& record) {
            auto name = j.find("name");
            if (name != j.end()) {
                if (!name->is_string()) return "name must be a string";
                record.name = name->get<std::string>();
            }

            auto port = j.find("port");
            if (port != j.end()) {
                if (!port->is_number_integer()) return "port must be an integer";
                auto value = port->get<int64_t>();
                if (value <= 0 || value > 65535) return "port out of range";
                record.port = static_cast<uint16_t>(value);
            }

            auto version = j.find("version");
            if (version != j.end()) {
                if (!version->is_string()) return "version must be a string";
                record.version = version->get<std::string>();
            }

            auto pin_required = j.find("pin_required");
            if (pin_required != j.end()) {
                if (!pin_required->is_boolean()) return "pin_required must be a boolean";
                record.pin_required = pin_required->get<bool>();
            }

            auto caps = j.find("capabilities");
            if (caps != j.end()) {
                if (!caps->is_array()) return "capabilities must be an array";
                record.capabilities.clear();
                for (const auto& c : *caps) {
                    if (!c.is_string()) return "capabilities must contain strings";
                    record.capabilities.push_back(c.get<std::string>());
                }
            }
            return "";
        }

    } // namespace

    std::string encode_discovery_reply(const HostRecord& self) {
        json j{
            {"name", self.name},
            {"ip", self.advertised_ip},
            {"port", self.port},
            {"pin_required", self.pin_required},
            {"version", self.version},
            {"capabilities", self.capabilities}
        };
        return j.dump();
    }

    common::Result<HostRecord> parse_discovery_reply(const std::string& text,
                                                     const std::string& source_address) {
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return record_error("discovery reply is not a JSON object");
        }

        HostRecord record;
        record.address = source_address;

        std::string problem = read_metadata(j, record);
        if (!problem.empty()) return record_error(problem);

        auto ip = j.find("ip");
        if (ip != j.end()) {
            if (!ip->is_string()) return record_error("ip must be a string");
            record.advertised_ip = ip->get<std::string>();
        }

        return record;
    }

    std::string serialize_host_list(const std::vector<HostRecord>& hosts) {
        json list = json::array();
        for (const auto& h : hosts) {
            list.push_back(json{
                {"name", h.name},
                {"address", h.address},
                {"advertised_ip", h.advertised_ip},
                {"port", h.port},
                {"version", h.version},
                {"pin_required", h.pin_required},
                {"capabilities", h.capabilities}
            });
        }
        return list.dump();
    }

    common::Result<std::vector<HostRecord>> deserialize_host_list(const std::string& text) {
        using ListResult = common::Result<std::vector<HostRecord>>;

        json j = json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_array()) {
            return ListResult::err(common::ErrorCode::ProtocolError, "host list is not a JSON array");
        }

        std::vector<HostRecord> hosts;
        for (const auto& item : j) {
            if (!item.is_object()) {
                return ListResult::err(common::ErrorCode::ProtocolError, "host entry is not an object");
            }
            HostRecord record;
            auto address = item.find("address");
            if (address == item.end() || !address->is_string() || address->get<std::string>().empty()) {
                return ListResult::err(common::ErrorCode::ProtocolError, "host entry without address");
            }
            record.address = address->get<std::string>();

            std::string problem = read_metadata(item, record);
            if (!problem.empty()) {
                return ListResult::err(common::ErrorCode::ProtocolError, problem);
            }

            auto advertised = item.find("advertised_ip");
            if (advertised != item.end() && advertised->is_string()) {
                record.advertised_ip = advertised->get<std::string>();
            }
            hosts.push_back(std::move(record));
        }
        return hosts;
    }

    common::Result<HostRecord> parse_host_endpoint(const std::string& text) {
        HostRecord record;
        record.name = text;

        auto colon = text.rfind(':');
        std::string host = colon == std::string::npos ? text : text.substr(0, colon);
        if (host.empty()) {
            return common::Result<HostRecord>::err(common::ErrorCode::InvalidArgument, "empty host address");
        }
        record.address = host;

        if (colon != std::string::npos) {
            std::string port_text = text.substr(colon + 1);
            if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
                port_text.size() > 5) {
                return common::Result<HostRecord>::err(common::ErrorCode::InvalidArgument,
                                                       "invalid port: " + port_text);
            }
            int port = std::stoi(port_text);
            if (port <= 0 || port > 65535) {
                return common::Result<HostRecord>::err(common::ErrorCode::InvalidArgument,
                                                       "port out of range: " + port_text);
            }
            record.port = static_cast<uint16_t>(port);
        }
        return record;
    }

} // namespace core
