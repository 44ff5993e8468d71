#include "platform/linux/unix_socket_server.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        log_error("ipc", "socket path too long: " + endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        log_error("ipc", std::format("socket() failed: {}", std::strerror(errno)));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error("ipc", std::format("bind() failed: {}", std::strerror(errno)));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = endpoint;

    if (::listen(server_fd_, 16) < 0) {
        log_error("ipc", std::format("listen() failed: {}", std::strerror(errno)));
        stop();
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::read_commands(int client_fd, std::vector<nlohmann::json>& cmds) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0) {
        // Spurious wakeup on a non-blocking socket
        return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    }
    if (n == 0) return false;

    client->buf.append(buf, static_cast<size_t>(n));

    size_t start = 0;
    for (auto pos = client->buf.find('\n'); pos != std::string::npos;
         pos = client->buf.find('\n', start)) {
        std::string_view line(client->buf.data() + start, pos - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) {
            cmds.push_back(nlohmann::json::parse(line, nullptr, false));
        }
        start = pos + 1;
    }
    client->buf.erase(0, start);

    if (client->buf.size() > MAX_LINE_BYTES) {
        log_error("ipc", std::format("client {} exceeded {} bytes without a newline",
                                     client_fd, MAX_LINE_BYTES));
        return false;
    }
    return true;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    // Backend text can carry invalid UTF-8; substitute it rather than throw.
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Large replies can fill the socket buffer; wait for the peer.
                pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, 5000) <= 0) return false;
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
