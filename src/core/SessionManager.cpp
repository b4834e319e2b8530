#include "core/SessionManager.hpp"
#include <algorithm>

namespace core {

SessionManager::SessionManager(SessionSettings settings,
                               std::shared_ptr<InputTranslator> translator,
                               std::shared_ptr<common::ILogger> logger)
    : settings_(std::move(settings)),
      translator_(std::move(translator)),
      logger_(logger ? std::move(logger) : common::make_null_logger()) {}

SessionManager::~SessionManager() = default;

// ============================================================================
// Registry
// ============================================================================

common::Result<SessionId> SessionManager::accept(std::shared_ptr<interfaces::IConnection> connection) {
    if (!connection) {
        return common::Result<SessionId>::err(common::ErrorCode::InvalidArgument, "null connection");
    }

    auto session = std::make_shared<Session>();
    session->connection = connection;
    session->remote_address = connection->remote_address();
    session->last_activity = std::chrono::steady_clock::now();

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (sessions_.size() >= settings_.max_sessions) {
            count = sessions_.size();
            session.reset();
        } else {
            session->id = next_id_++;
            sessions_.emplace(session->id, session);
            count = sessions_.size();
        }
    }

    if (!session) {
        logger_->warn("[Session] Refused " + connection->remote_address() + ": server full (" +
                      std::to_string(count) + "/" + std::to_string(settings_.max_sessions) + ")");
        auto sent = connection->send_text(protocol::encode_error(protocol::ERR_SERVER_FULL));
        if (sent.is_err()) {
            logger_->debug("[Session] Could not notify refused client: " + sent.error().message);
        }
        connection->close();
        return common::Result<SessionId>::err(common::ErrorCode::CapacityError, protocol::ERR_SERVER_FULL);
    }

    logger_->info("[Session] #" + std::to_string(session->id) + " connected from " +
                  session->remote_address + " (" + std::to_string(count) + " active)");
    return session->id;
}

std::shared_ptr<SessionManager::Session> SessionManager::lookup(SessionId id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionManager::on_disconnect(SessionId id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }

    std::vector<interfaces::MouseButton> held;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        held.assign(session->held_buttons.begin(), session->held_buttons.end());
        session->held_buttons.clear();
    }
    if (!held.empty() && translator_) {
        translator_->release_buttons(held);
    }

    logger_->info("[Session] #" + std::to_string(id) + " disconnected (" +
                  session->remote_address + ")");
}

bool SessionManager::expire_unauthenticated(SessionId id) {
    auto session = lookup(id);
    if (!session) return false;

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->state == AuthState::Authenticated) return false;

    logger_->warn("[Session] #" + std::to_string(id) + " authentication timeout");
    reply(*session, protocol::Error{protocol::ERR_AUTH_TIMEOUT});
    session->connection->close();
    return true;
}

void SessionManager::close_all() {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto& entry : sessions_) snapshot.push_back(entry.second);
    }
    for (auto& session : snapshot) {
        session->connection->close();
    }
}

bool SessionManager::is_authenticated(SessionId id) const {
    auto session = lookup(id);
    if (!session) return false;
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->state == AuthState::Authenticated;
}

std::optional<SessionInfo> SessionManager::find(SessionId id) const {
    auto session = lookup(id);
    if (!session) return std::nullopt;
    std::lock_guard<std::mutex> lock(session->mutex);
    return SessionInfo{session->id, session->remote_address, session->state, session->last_activity};
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

// ============================================================================
// Message processing
// ============================================================================

Disposition SessionManager::on_message(SessionId id, const std::string& text) {
    auto decoded = protocol::decode(text);
    if (decoded.is_ok()) {
        return on_message(id, decoded.unwrap());
    }

    auto session = lookup(id);
    if (!session) return Disposition::Close;

    std::lock_guard<std::mutex> lock(session->mutex);
    session->last_activity = std::chrono::steady_clock::now();
    logger_->warn("[Session] #" + std::to_string(id) + " bad message: " + decoded.error().message);
    reply(*session, protocol::Error{decoded.error().message});
    return Disposition::Continue;
}

Disposition SessionManager::on_message(SessionId id, const protocol::ControlMessage& message) {
    auto session = lookup(id);
    if (!session) return Disposition::Close;

    std::lock_guard<std::mutex> lock(session->mutex);
    session->last_activity = std::chrono::steady_clock::now();

    if (session->state == AuthState::Unauthenticated) {
        return handle_unauthenticated(*session, message);
    }
    return handle_authenticated(*session, message);
}

Disposition SessionManager::handle_unauthenticated(Session& session, const protocol::ControlMessage& message) {
    const auto* hello = std::get_if<protocol::Hello>(&message);
    if (!hello) {
        logger_->warn("[Session] #" + std::to_string(session.id) + " sent '" +
                      protocol::type_tag(message) + "' before authenticating");
        reply(session, protocol::Error{protocol::ERR_AUTH_REQUIRED});
        return Disposition::Continue;
    }

    if (!pin_matches(hello->pin)) {
        logger_->warn("[Session] #" + std::to_string(session.id) + " invalid PIN from " +
                      session.remote_address);
        reply(session, protocol::Error{protocol::ERR_INVALID_PIN});
        session.connection->close();
        return Disposition::Close;
    }

    session.state = AuthState::Authenticated;
    logger_->info("[Session] #" + std::to_string(session.id) + " authenticated");
    reply(session, protocol::Ok{settings_.server_name, settings_.capabilities});
    return Disposition::Continue;
}

Disposition SessionManager::handle_authenticated(Session& session, const protocol::ControlMessage& message) {
    if (std::holds_alternative<protocol::Hello>(message)) {
        reply(session, protocol::Error{protocol::ERR_ALREADY_AUTHENTICATED});
        return Disposition::Continue;
    }
    if (std::holds_alternative<protocol::Ping>(message)) {
        reply(session, protocol::Pong{});
        return Disposition::Continue;
    }
    if (std::holds_alternative<protocol::Pong>(message)) {
        return Disposition::Continue;
    }

    if (!translator_) {
        reply(session, protocol::Error{"input is not available on this host"});
        return Disposition::Continue;
    }

    command::CommandContext ctx{session.id, session.remote_address};
    auto result = translator_->translate(message, ctx);
    if (result.is_err()) {
        logger_->warn("[Session] #" + std::to_string(session.id) + " " + protocol::type_tag(message) +
                      " failed: " + result.error().message);
        reply(session, protocol::Error{result.error().message});
        return Disposition::Continue;
    }

    // Track buttons left down so they can be released if the session ends
    if (const auto* click = std::get_if<protocol::Click>(&message)) {
        if (click->down.has_value()) {
            auto button = parse_mouse_button(click->button);
            if (button.is_ok()) {
                if (*click->down) session.held_buttons.insert(button.unwrap());
                else session.held_buttons.erase(button.unwrap());
            }
        }
    }
    return Disposition::Continue;
}

void SessionManager::reply(Session& session, const protocol::ControlMessage& message) {
    auto sent = session.connection->send_text(protocol::encode(message));
    if (sent.is_err()) {
        logger_->debug("[Session] #" + std::to_string(session.id) + " reply failed: " + sent.error().message);
    }
}

// Constant time over the longer of the two lengths
bool SessionManager::pin_matches(const std::string& candidate) const {
    const std::string& expected = settings_.pin;
    if (expected.empty()) return true;

    size_t length = std::max(expected.size(), candidate.size());
    unsigned char diff = static_cast<unsigned char>(expected.size() != candidate.size());
    for (size_t i = 0; i < length; ++i) {
        unsigned char a = i < expected.size() ? static_cast<unsigned char>(expected[i]) : 0;
        unsigned char b = i < candidate.size() ? static_cast<unsigned char>(candidate[i]) : 0;
        diff |= static_cast<unsigned char>(a ^ b);
    }
    return diff == 0;
}

} // namespace core
