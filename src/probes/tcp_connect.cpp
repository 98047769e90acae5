/**
 * @file tcp_connect.cpp
 * @brief Проверка TCP-подключения через неблокирующий connect()
 */

#include "tcp_connect.hpp"
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hostdiag::probes {
namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

/// 0 при успехе, иначе errno (ETIMEDOUT при истечении ожидания)
int connectWithTimeout(const addrinfo& addr, std::chrono::milliseconds timeout) {
    Socket sock(::socket(addr.ai_family, addr.ai_socktype | SOCK_CLOEXEC, addr.ai_protocol));
    if (!sock.valid()) {
        return errno;
    }

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno;
    }

    if (::connect(sock.get(), addr.ai_addr, addr.ai_addrlen) == 0) {
        return 0;
    }
    if (errno != EINPROGRESS) {
        return errno;
    }

    pollfd pfd{sock.get(), POLLOUT, 0};
    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        return ETIMEDOUT;
    }
    if (ready < 0) {
        return errno;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        return errno;
    }
    return so_error;
}

} // namespace

TcpConnectResult tcpConnect(
    const std::string& host,
    std::uint16_t port,
    std::chrono::milliseconds timeout
) {
    TcpConnectResult result;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &raw);
    if (rc != 0) {
        result.error = std::string("resolve failed: ") + ::gai_strerror(rc);
        return result;
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(raw);

    // Один срок на все адреса: суммарное ожидание не превышает timeout
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int last_error = 0;
    for (addrinfo* it = addresses.get(); it != nullptr; it = it->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            last_error = ETIMEDOUT;
            break;
        }
        last_error = connectWithTimeout(*it, remaining);
        if (last_error == 0) {
            result.connected = true;
            return result;
        }
    }

    result.error = last_error != 0 ? std::strerror(last_error) : "no addresses";
    return result;
}

} // namespace hostdiag::probes
