#include "socket.hpp"

#include "error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace janus {

namespace {

[[noreturn]] void throw_socket_error(const std::string& what, int err) {
    throw JanusError(ErrorCode::socket_error, what + ": " + std::strerror(err));
}

} // namespace

sockaddr_un make_unix_address(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        throw JanusError(ErrorCode::socket_error, "socket path length " + std::to_string(path.size()) +
                                                      " does not fit sun_path");
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

int open_datagram_socket() {
    int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw_socket_error("socket", errno);
    }
    return fd;
}

int bind_datagram_socket(const std::string& path, bool unlink_existing) {
    sockaddr_un addr = make_unix_address(path);
    int fd = open_datagram_socket();

    if (unlink_existing) {
        ::unlink(path.c_str());
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw_socket_error("bind " + path, err);
    }
    return fd;
}

int send_datagram(int fd, const std::string& path, const std::string& payload) {
    sockaddr_un addr{};
    try {
        addr = make_unix_address(path);
    } catch (const JanusError&) {
        return ENAMETOOLONG;
    }

    ssize_t sent = ::sendto(fd, payload.data(), payload.size(), MSG_DONTWAIT | MSG_NOSIGNAL,
                            reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        return errno;
    }
    if (static_cast<size_t>(sent) != payload.size()) {
        return EMSGSIZE;
    }
    return 0;
}

bool receive_datagram(int fd, size_t max_size, std::string& out, bool& truncated) {
    std::vector<char> buffer(max_size + 1);
    ssize_t received = ::recv(fd, buffer.data(), buffer.size(), MSG_DONTWAIT | MSG_TRUNC);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return false;
        }
        throw_socket_error("recv", errno);
    }
    size_t length = static_cast<size_t>(received);
    truncated = length > max_size;
    out.assign(buffer.data(), std::min(length, max_size));
    return true;
}

void close_socket(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void unlink_socket_path(const std::string& path) {
    if (!path.empty()) {
        ::unlink(path.c_str());
    }
}

} // namespace janus
