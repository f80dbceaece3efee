#pragma once

#include <sys/socket.h>
#include <sys/un.h>

#include <string>

namespace janus {

/// Fills a sockaddr_un for `path`; throws JanusError (socket_error) when the
/// path does not fit into sun_path.
sockaddr_un make_unix_address(const std::string& path);

/// Creates a non-blocking SOCK_DGRAM socket bound to `path`. Any stale file
/// at the path is unlinked first when `unlink_existing` is set.
/// Throws JanusError (socket_error) on failure.
int bind_datagram_socket(const std::string& path, bool unlink_existing);

/// Unbound non-blocking SOCK_DGRAM socket used only for sending.
int open_datagram_socket();

/// Sends one datagram to `path`. Returns 0 on success or the errno value.
int send_datagram(int fd, const std::string& path, const std::string& payload);

/// Reads one pending datagram into `out`. Returns false when nothing was
/// available; `truncated` is set when the datagram was larger than max_size.
bool receive_datagram(int fd, size_t max_size, std::string& out, bool& truncated);

void close_socket(int& fd);
void unlink_socket_path(const std::string& path);

} // namespace janus
