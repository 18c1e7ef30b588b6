#include "daemon/status_server.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

static const std::size_t MAX_REQUEST_BYTES = 65536;

StatusServer::StatusServer(std::string socket_path, SnapshotProvider provider, std::function<void()> on_stop)
    : socket_path_(std::move(socket_path)), provider_(std::move(provider)), on_stop_(std::move(on_stop)) {}

StatusServer::~StatusServer() {
    stop();
}

void StatusServer::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
    if (!socket_path_.empty()) {
        unlink(socket_path_.c_str());
    }
}

bool StatusServer::start() {
    auto log = Logging::get();
    if (socket_path_.empty()) return false;

    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        log->error("Status socket path too long: {}", socket_path_);
        return false;
    }

    // Clean up any stale socket
    unlink(socket_path_.c_str());

    std::error_code ec;
    fs::path parent = fs::path(socket_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            log->error("Cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        log->error("Status socket: {}", std::strerror(errno));
        return false;
    }

    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        log->error("Cannot bind status socket {}: {}", socket_path_, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(socket_path_.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        log->error("Cannot listen on status socket {}: {}", socket_path_, std::strerror(errno));
        cleanup_socket();
        return false;
    }

    stop_flag_.store(false);
    thread_ = std::thread(&StatusServer::serve_loop, this);
    log->info("Status socket listening on {}", socket_path_);
    return true;
}

void StatusServer::stop() {
    stop_flag_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (socket_fd_ >= 0) {
        cleanup_socket();
    }
}

void StatusServer::serve_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        pfd.revents = 0;
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (!(pfd.revents & POLLIN)) continue;

        int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) continue;

        // A stalled client must not hold up the loop
        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        // Read a single JSON line
        std::string buffer;
        char c;
        while (read(client_fd, &c, 1) == 1) {
            if (c == '\n') break;
            buffer += c;
            if (buffer.size() > MAX_REQUEST_BYTES) break;
        }

        if (!buffer.empty()) {
            std::string response = handle_command(buffer) + "\n";
            std::size_t total = 0;
            while (total < response.size()) {
                ssize_t n = send(client_fd, response.data() + total, response.size() - total, MSG_NOSIGNAL);
                if (n <= 0) break;
                total += static_cast<std::size_t>(n);
            }
        }

        close(client_fd);
    }
}

json StatusServer::to_json(const WorkerSnapshot& snapshot) {
    return json{
        {"id", snapshot.id},
        {"state", to_string(snapshot.state)},
        {"pid", snapshot.pid},
        {"restarts", snapshot.restarts},
        {"records", snapshot.records},
        {"heartbeats", snapshot.heartbeats},
        {"ms_since_activity", snapshot.ms_since_activity},
        {"ms_since_heartbeat", snapshot.ms_since_heartbeat}
    };
}

std::string StatusServer::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            json workers = json::array();
            if (provider_) {
                for (const auto& snapshot : provider_()) {
                    workers.push_back(to_json(snapshot));
                }
            }
            return json({{"ok", true}, {"data", {{"workers", workers}}}}).dump();
        }

        if (cmd == "stop") {
            Logging::get()->info("Stop requested over status socket");
            if (on_stop_) on_stop_();
            return json({{"ok", true}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const json::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}
