#include "daemon/status_client.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

StatusClient::StatusClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

json StatusClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    std::size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += static_cast<std::size_t>(n);
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 1024 * 1024) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::exception&) {
        return json();
    }
}

bool StatusClient::get_status(std::vector<WorkerStatus>& workers, std::string& err) {
    workers.clear();
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty()) {
        err = "Cannot connect to supervisor at " + socket_path_;
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }

    try {
        for (const auto& item : resp.at("data").at("workers")) {
            WorkerStatus status;
            status.id = item.value("id", 0);
            status.state = item.value("state", "");
            status.pid = item.value("pid", -1);
            status.restarts = item.value("restarts", std::size_t(0));
            status.records = item.value("records", std::size_t(0));
            status.heartbeats = item.value("heartbeats", std::size_t(0));
            status.ms_since_activity = item.value("ms_since_activity", -1LL);
            status.ms_since_heartbeat = item.value("ms_since_heartbeat", -1LL);
            workers.push_back(std::move(status));
        }
    } catch (const json::exception& e) {
        err = std::string("Malformed response: ") + e.what();
        return false;
    }
    return true;
}

bool StatusClient::request_stop(std::string& err) {
    auto resp = send_command({{"cmd", "stop"}});
    if (resp.empty()) {
        err = "Cannot connect to supervisor at " + socket_path_;
        return false;
    }
    if (resp.value("ok", false)) return true;
    err = resp.value("error", "Unknown error");
    return false;
}
