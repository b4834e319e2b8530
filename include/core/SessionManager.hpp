#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/InputTranslator.hpp"
#include "core/Protocol.hpp"
#include "interfaces/IConnection.hpp"

namespace core {

using SessionId = uint64_t;

enum class AuthState {
    Unauthenticated,
    Authenticated
};

// What the transport should do after a message was processed
enum class Disposition {
    Continue,
    Close
};

struct SessionSettings {
    std::string server_name = "RemoteMouse Pro";
    std::string pin = "123456";   // empty: any Hello is accepted
    size_t max_sessions = 10;
    std::vector<std::string> capabilities;
};

// Read-only view of a session for callers outside the manager
struct SessionInfo {
    SessionId id = 0;
    std::string remote_address;
    AuthState state = AuthState::Unauthenticated;
    std::chrono::steady_clock::time_point last_activity;
};

// ============================================================================
// SessionManager - authentication and per-client state on the host
// ============================================================================
// Thread Safety:
// - The registry mutex guards insert/remove/lookup and the capacity check.
// - Each session has its own mutex held while one of its messages is
//   processed, so a session's messages are strictly ordered while different
//   sessions translate concurrently.
// ============================================================================

class SessionManager {
public:
    SessionManager(SessionSettings settings,
                   std::shared_ptr<InputTranslator> translator,
                   std::shared_ptr<common::ILogger> logger);
    ~SessionManager();

    // Register a new connection as unauthenticated.
    // At capacity: best-effort Error{"server full"}, connection closed,
    // CapacityError returned. Nothing is queued.
    common::Result<SessionId> accept(std::shared_ptr<interfaces::IConnection> connection);

    // Raw text entry point: decode, then process. Decode failures are
    // answered with an Error and the session is kept.
    Disposition on_message(SessionId id, const std::string& text);

    Disposition on_message(SessionId id, const protocol::ControlMessage& message);

    // Remove the session and release any buttons it still holds
    void on_disconnect(SessionId id);

    // Close a session that never authenticated, with Error{"authentication timeout"}.
    // Returns false when the session is unknown or already authenticated.
    bool expire_unauthenticated(SessionId id);

    // Close every connection (shutdown). Sessions are removed as their
    // transports report the disconnect.
    void close_all();

    bool is_authenticated(SessionId id) const;
    std::optional<SessionInfo> find(SessionId id) const;
    size_t session_count() const;

private:
    struct Session {
        SessionId id = 0;
        std::shared_ptr<interfaces::IConnection> connection;
        std::string remote_address;
        AuthState state = AuthState::Unauthenticated;
        std::chrono::steady_clock::time_point last_activity;
        std::set<interfaces::MouseButton> held_buttons;
        std::mutex mutex;
    };

    std::shared_ptr<Session> lookup(SessionId id) const;

    // Both run with session.mutex held
    Disposition handle_unauthenticated(Session& session, const protocol::ControlMessage& message);
    Disposition handle_authenticated(Session& session, const protocol::ControlMessage& message);

    void reply(Session& session, const protocol::ControlMessage& message);
    bool pin_matches(const std::string& candidate) const;

    SessionSettings settings_;
    std::shared_ptr<InputTranslator> translator_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
    std::atomic<SessionId> next_id_{1};
};

} // namespace core
