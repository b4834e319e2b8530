#include "core/Protocol.hpp"
#include <nlohmann/json.hpp>

namespace core {
namespace protocol {

    using nlohmann::json;

    namespace {

        // Visitor producing the JSON object for each message type
        struct Encoder {
            json operator()(const Hello& m) const {
                return json{{"t", "hello"}, {"pin", m.pin}};
            }
            json operator()(const Ok& m) const {
                json j{{"t", "ok"}};
                if (!m.server.empty()) j["server"] = m.server;
                if (!m.capabilities.empty()) j["capabilities"] = m.capabilities;
                return j;
            }
            json operator()(const Error& m) const {
                return json{{"t", "error"}, {"msg", m.message}};
            }
            json operator()(const Move& m) const {
                return json{{"t", "move"}, {"dx", m.dx}, {"dy", m.dy}};
            }
            json operator()(const Click& m) const {
                json j{{"t", "click"}, {"btn", m.button}};
                if (m.down.has_value()) j["down"] = *m.down;
                return j;
            }
            json operator()(const Key& m) const {
                return json{{"t", "key"}, {"text", m.text}};
            }
            json operator()(const Hotkey& m) const {
                return json{{"t", "hotkey"}, {"keys", m.keys}};
            }
            json operator()(const Scroll& m) const {
                return json{{"t", "scroll"}, {"dx", m.dx}, {"dy", m.dy}};
            }
            json operator()(const Ping&) const { return json{{"t", "ping"}}; }
            json operator()(const Pong&) const { return json{{"t", "pong"}}; }
        };

        common::Result<ControlMessage> protocol_error(const std::string& msg) {
            return common::Result<ControlMessage>::err(common::ErrorCode::ProtocolError, msg);
        }

        bool require_string(const json& j, const char* field, std::string& out) {
            auto it = j.find(field);
            if (it == j.end() || !it->is_string()) return false;
            out = it->get<std::string>();
            return true;
        }

        bool require_number(const json& j, const char* field, double& out) {
            auto it = j.find(field);
            if (it == j.end() || !it->is_number()) return false;
            out = it->get<double>();
            return true;
        }

        bool require_integer(const json& j, const char* field, int& out) {
            auto it = j.find(field);
            if (it == j.end() || !it->is_number_integer()) return false;
            // Non-negative literals parse as unsigned and may not fit int64_t
            if (it->is_number_unsigned()) {
                auto value = it->get<uint64_t>();
                if (value > static_cast<uint64_t>(INT32_MAX)) return false;
                out = static_cast<int>(value);
                return true;
            }
            auto value = it->get<int64_t>();
            if (value < INT32_MIN || value > INT32_MAX) return false;
            out = static_cast<int>(value);
            return true;
        }

        // Optional string array; absent leaves `out` untouched
        bool optional_string_array(const json& j, const char* field, std::vector<std::string>& out) {
            auto it = j.find(field);
            if (it == j.end()) return true;
            if (!it->is_array()) return false;
            std::vector<std::string> values;
            for (const auto& item : *it) {
                if (!item.is_string()) return false;
                values.push_back(item.get<std::string>());
            }
            out = std::move(values);
            return true;
        }

        std::string bad_field(const std::string& type, const char* field) {
            return "invalid or missing field '" + std::string(field) + "' in " + type;
        }

    } // namespace

    std::string encode(const ControlMessage& message) {
        return std::visit(Encoder{}, message).dump();
    }

    common::Result<ControlMessage> decode(const std::string& text) {
        json j = json::parse(text, nullptr, false);
        if (j.is_discarded()) {
            return protocol_error("invalid json");
        }
        if (!j.is_object()) {
            return protocol_error("message must be a JSON object");
        }

        std::string type;
        if (!require_string(j, "t", type)) {
            return protocol_error("missing message type");
        }

        if (type == "hello") {
            Hello m;
            if (!require_string(j, "pin", m.pin)) return protocol_error(bad_field(type, "pin"));
            return ControlMessage(m);
        }
        if (type == "ok") {
            Ok m;
            auto server = j.find("server");
            if (server != j.end()) {
                if (!server->is_string()) return protocol_error(bad_field(type, "server"));
                m.server = server->get<std::string>();
            }
            if (!optional_string_array(j, "capabilities", m.capabilities)) {
                return protocol_error(bad_field(type, "capabilities"));
            }
            return ControlMessage(m);
        }
        if (type == "error") {
            Error m;
            auto msg = j.find("msg");
            if (msg != j.end()) {
                if (!msg->is_string()) return protocol_error(bad_field(type, "msg"));
                m.message = msg->get<std::string>();
            }
            return ControlMessage(m);
        }
        if (type == "move") {
            Move m;
            if (!require_number(j, "dx", m.dx)) return protocol_error(bad_field(type, "dx"));
            if (!require_number(j, "dy", m.dy)) return protocol_error(bad_field(type, "dy"));
            return ControlMessage(m);
        }
        if (type == "click") {
            Click m;
            auto btn = j.find("btn");
            if (btn != j.end()) {
                if (!btn->is_string()) return protocol_error(bad_field(type, "btn"));
                m.button = btn->get<std::string>();
            }
            auto down = j.find("down");
            if (down != j.end() && !down->is_null()) {
                if (!down->is_boolean()) return protocol_error(bad_field(type, "down"));
                m.down = down->get<bool>();
            }
            return ControlMessage(m);
        }
        if (type == "key") {
            Key m;
            if (!require_string(j, "text", m.text)) return protocol_error(bad_field(type, "text"));
            return ControlMessage(m);
        }
        if (type == "hotkey") {
            Hotkey m;
            if (j.find("keys") == j.end() || !optional_string_array(j, "keys", m.keys)) {
                return protocol_error(bad_field(type, "keys"));
            }
            return ControlMessage(m);
        }
        if (type == "scroll") {
            Scroll m;
            if (!require_integer(j, "dx", m.dx)) return protocol_error(bad_field(type, "dx"));
            if (!require_integer(j, "dy", m.dy)) return protocol_error(bad_field(type, "dy"));
            return ControlMessage(m);
        }
        if (type == "ping") return ControlMessage(Ping{});
        if (type == "pong") return ControlMessage(Pong{});

        return protocol_error("unknown message type: " + type);
    }

    const char* type_tag(const ControlMessage& message) noexcept {
        switch (message.index()) {
            case 0: return "hello";
            case 1: return "ok";
            case 2: return "error";
            case 3: return "move";
            case 4: return "click";
            case 5: return "key";
            case 6: return "hotkey";
            case 7: return "scroll";
            case 8: return "ping";
            case 9: return "pong";
        }
        return "unknown";
    }

} // namespace protocol
} // namespace core
