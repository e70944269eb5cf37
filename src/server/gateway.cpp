/*
 * sandterm C++ - Realtime Gateway Implementation
 */
#include <sandterm/server/gateway.hpp>
#include <sandterm/server/events.hpp>
#include <sandterm/server/terminal_service.hpp>
#include <sandterm/session/identity.hpp>
#include <sandterm/core/config.hpp>
#include <sandterm/core/logger.hpp>
#include <sandterm/core/utils.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace sandterm {

static const int POLL_INTERVAL_MS = 200;

GatewaySettings GatewaySettings::from_config(const Config& cfg) {
    GatewaySettings s;
    s.bind = cfg.get_string("gateway.bind", s.bind);
    s.port = static_cast<int>(cfg.get_int("gateway.port", s.port));
    s.max_frame_bytes = static_cast<size_t>(
        cfg.get_int("gateway.max_frame_bytes", static_cast<int64_t>(s.max_frame_bytes)));
    s.hello_timeout_ms = static_cast<int>(
        cfg.get_int("gateway.hello_timeout_seconds", s.hello_timeout_ms / 1000) * 1000);
    return s;
}

bool Gateway::Connection::send_frame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (!open.load()) return false;

    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("[Gateway] Write to %s failed: %s", peer.c_str(), strerror(errno));
            open.store(false);
            ::shutdown(fd, SHUT_RDWR);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

Gateway::Gateway(TerminalService& service, IdentityProvider& identity,
                 const GatewaySettings& settings)
    : service_(service)
    , identity_(identity)
    , settings_(settings)
    , listen_fd_(-1)
    , bound_port_(0)
    , running_(false)
    , next_id_(1)
{
}

Gateway::~Gateway() {
    stop();
}

bool Gateway::start() {
    if (running_.load()) return true;

    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        LOG_ERROR("[Gateway] Failed to create socket: %s", strerror(errno));
        return false;
    }

    int reuse = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_WARN("[Gateway] SO_REUSEADDR failed: %s", strerror(errno));
    }

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(settings_.port));
    if (inet_pton(AF_INET, settings_.bind.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("[Gateway] Invalid bind address: %s", settings_.bind.c_str());
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("[Gateway] Failed to bind %s:%d: %s", settings_.bind.c_str(), settings_.port,
                  strerror(errno));
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (listen(listen_fd_, 64) < 0) {
        LOG_ERROR("[Gateway] Failed to listen: %s", strerror(errno));
        close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    } else {
        bound_port_ = settings_.port;
    }

    running_ = true;
    accept_thread_ = std::thread(&Gateway::accept_loop, this);
    LOG_INFO("[Gateway] Listening on %s:%d", settings_.bind.c_str(), bound_port_);
    return true;
}

void Gateway::stop() {
    if (!running_.exchange(false)) return;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
    }

    std::map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (auto it = connections_.begin(); it != connections_.end(); ++it) {
            std::lock_guard<std::mutex> write_lock(it->second->write_mutex);
            if (it->second->open.load()) {
                ::shutdown(it->second->fd, SHUT_RDWR);
            }
        }
        threads.swap(threads_);
        finished_.clear();
    }
    for (auto it = threads.begin(); it != threads.end(); ++it) {
        if (it->second.joinable()) it->second.join();
    }
    LOG_INFO("[Gateway] Stopped");
}

size_t Gateway::connection_count() const {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return connections_.size();
}

void Gateway::accept_loop() {
    while (running_.load()) {
        reap_finished();

        pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Gateway] poll failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;

        sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                         SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && running_.load()) {
                LOG_WARN("[Gateway] Failed to accept connection: %s", strerror(errno));
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

        std::shared_ptr<Connection> conn = std::make_shared<Connection>();
        conn->fd = fd;
        conn->peer = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));

        std::lock_guard<std::mutex> lock(conn_mutex_);
        conn->id = next_id_++;
        connections_[conn->id] = conn;
        threads_[conn->id] = std::thread(&Gateway::serve, this, conn);
        LOG_DEBUG("[Gateway] Connection %llu from %s",
                  static_cast<unsigned long long>(conn->id), conn->peer.c_str());
    }
}

void Gateway::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (size_t i = 0; i < finished_.size(); ++i) {
            auto it = threads_.find(finished_[i]);
            if (it != threads_.end()) {
                done.push_back(std::move(it->second));
                threads_.erase(it);
            }
        }
        finished_.clear();
    }
    for (size_t i = 0; i < done.size(); ++i) {
        if (done[i].joinable()) done[i].join();
    }
}

Gateway::ReadStatus Gateway::read_line(Connection& conn, std::string& buffer, std::string& line,
                                       int timeout_ms) {
    int64_t deadline = monotonic_ms() + timeout_ms;

    for (;;) {
        size_t nl = buffer.find('\n');
        if (nl != std::string::npos) {
            line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
            if (!line.empty() && line[line.size() - 1] == '\r') {
                line.erase(line.size() - 1);
            }
            return READ_LINE;
        }
        if (buffer.size() > settings_.max_frame_bytes) {
            return READ_TOO_LONG;
        }
        if (!conn.open.load() || !running_.load()) {
            return READ_CLOSED;
        }

        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            return READ_IDLE;
        }

        pollfd pfd;
        pfd.fd = conn.fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, static_cast<int>(remaining < POLL_INTERVAL_MS ? remaining : POLL_INTERVAL_MS));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return READ_CLOSED;
        }
        if (rc == 0) continue;

        char chunk[4096];
        ssize_t n = recv(conn.fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return READ_CLOSED;
        }
        if (n == 0) {
            return READ_CLOSED;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

bool Gateway::authenticate(Connection& conn, std::string& buffer, UserContext& user) {
    std::string line;
    ReadStatus status = read_line(conn, buffer, line, settings_.hello_timeout_ms);
    if (status != READ_LINE) {
        if (status == READ_IDLE) {
            Json err;
            err["error"] = "Authentication timed out";
            conn.send_frame(encode_frame(events::ERROR, err));
        }
        return false;
    }

    std::string event;
    std::string parse_error;
    Json frame;
    if (!parse_frame(line, event, frame, parse_error) || event != events::HELLO) {
        Json err;
        err["error"] = "Expected hello frame";
        conn.send_frame(encode_frame(events::ERROR, err));
        return false;
    }

    std::string token;
    if (frame.contains("token") && frame["token"].is_string()) {
        token = frame["token"].get<std::string>();
    } else if (frame["data"].is_object() && frame["data"].contains("token") &&
               frame["data"]["token"].is_string()) {
        token = frame["data"]["token"].get<std::string>();
    }

    if (token.empty() || !identity_.resolve(token, user)) {
        LOG_WARN("[Gateway] Authentication failed for %s", conn.peer.c_str());
        Json err;
        err["error"] = "Authentication failed";
        conn.send_frame(encode_frame(events::ERROR, err));
        return false;
    }
    return true;
}

void Gateway::serve(std::shared_ptr<Connection> conn) {
    std::string buffer;
    UserContext user;
    std::string session_id;

    if (authenticate(*conn, buffer, user)) {
        session_id = generate_uuid();
        std::shared_ptr<Connection> writer = conn;
        EventEmitter emit_fn = [writer](const std::string& event, const Json& data) {
            writer->send_frame(encode_frame(event, data));
        };

        if (!service_.connect(session_id, user, emit_fn)) {
            session_id.clear();
        }
    }

    while (!session_id.empty()) {
        std::string line;
        ReadStatus status = read_line(*conn, buffer, line, POLL_INTERVAL_MS * 5);
        if (status == READ_IDLE) continue;
        if (status == READ_CLOSED) break;
        if (status == READ_TOO_LONG) {
            Json err;
            err["error"] = "Frame too large";
            conn->send_frame(encode_frame(events::ERROR, err));
            break;
        }
        if (trim(line).empty()) continue;

        std::string event;
        std::string parse_error;
        Json frame;
        if (!parse_frame(line, event, frame, parse_error)) {
            Json err;
            err["error"] = parse_error;
            conn->send_frame(encode_frame(events::ERROR, err));
            continue;
        }
        service_.handle_event(session_id, event, frame["data"]);
    }

    if (!session_id.empty()) {
        service_.disconnect(session_id);
    }

    {
        std::lock_guard<std::mutex> lock(conn->write_mutex);
        conn->open.store(false);
        close(conn->fd);
    }
    LOG_DEBUG("[Gateway] Connection %llu closed", static_cast<unsigned long long>(conn->id));

    std::lock_guard<std::mutex> lock(conn_mutex_);
    connections_.erase(conn->id);
    finished_.push_back(conn->id);
}

} // namespace sandterm
