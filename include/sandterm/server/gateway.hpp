/*
 * sandterm C++ - Realtime Gateway
 *
 * TCP listener speaking newline-delimited JSON frames (see events.hpp).
 * One reader thread per connection. A connection must authenticate with a
 * hello frame before anything else; it then maps to exactly one terminal
 * session, destroyed when the socket closes.
 */
#ifndef sandterm_SERVER_GATEWAY_HPP
#define sandterm_SERVER_GATEWAY_HPP

#include <sandterm/core/types.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sandterm {

class Config;
class IdentityProvider;
class TerminalService;

struct GatewaySettings {
    std::string bind;
    int port;                   // 0 picks a free port
    size_t max_frame_bytes;
    int hello_timeout_ms;

    GatewaySettings()
        : bind("127.0.0.1"), port(8765), max_frame_bytes(64 * 1024), hello_timeout_ms(10000) {}

    static GatewaySettings from_config(const Config& cfg);
};

class Gateway {
public:
    Gateway(TerminalService& service, IdentityProvider& identity, const GatewaySettings& settings);
    ~Gateway();

    bool start();
    void stop();

    bool running() const { return running_.load(); }

    // Port actually bound (differs from settings when 0 was requested)
    int port() const { return bound_port_; }

    size_t connection_count() const;

private:
    Gateway(const Gateway&);
    Gateway& operator=(const Gateway&);

    struct Connection {
        uint64_t id;
        int fd;
        std::mutex write_mutex;
        std::atomic<bool> open;
        std::string peer;

        Connection() : id(0), fd(-1), open(true) {}

        bool send_frame(const std::string& frame);
    };

    enum ReadStatus { READ_LINE, READ_IDLE, READ_CLOSED, READ_TOO_LONG };

    void accept_loop();
    void serve(std::shared_ptr<Connection> conn);
    ReadStatus read_line(Connection& conn, std::string& buffer, std::string& line, int timeout_ms);
    bool authenticate(Connection& conn, std::string& buffer, UserContext& user);
    void reap_finished();

    TerminalService& service_;
    IdentityProvider& identity_;
    GatewaySettings settings_;

    int listen_fd_;
    int bound_port_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    mutable std::mutex conn_mutex_;
    uint64_t next_id_;
    std::map<uint64_t, std::shared_ptr<Connection>> connections_;
    std::map<uint64_t, std::thread> threads_;
    std::vector<uint64_t> finished_;
};

} // namespace sandterm

#endif // sandterm_SERVER_GATEWAY_HPP
