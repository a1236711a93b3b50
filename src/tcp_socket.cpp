#include "threadmail/tcp_socket.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

// SocketConnection

SocketConnection::SocketConnection(int fd, std::string peer) :
    _fd(fd), _peer(peer), _closed(false)
{
}

SocketConnection::~SocketConnection() {
    close();
    ::close(_fd);
}

bool SocketConnection::fill() {
    char tmp[4096];
    while (true) {
        ssize_t n = ::recv(_fd, tmp, sizeof(tmp), 0);
        if (n > 0) {
            _buffer.append(tmp, (size_t)n);
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

bool SocketConnection::readLine(std::string & line) {
    while (true) {
        size_t newline = _buffer.find('\n');
        if (newline != std::string::npos) {
            line = _buffer.substr(0, newline);
            _buffer.erase(0, newline + 1);
            if (line.size() > 0 && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        if (_buffer.size() > THREADMAIL_MAX_LINE_BYTES || _closed) {
            return false;
        }
        if (!fill()) {
            return false;
        }
    }
}

bool SocketConnection::readSome(std::string & out) {
    if (_buffer.size() == 0 && (_closed || !fill())) {
        return false;
    }
    out.swap(_buffer);
    _buffer.clear();
    return true;
}

bool SocketConnection::writeLine(const std::string & line) {
    return writeRaw(line + "\r\n");
}

bool SocketConnection::writeRaw(const std::string & data) {
    std::lock_guard<std::mutex> lock(_writeMtx);
    if (_closed) {
        return false;
    }
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += (size_t)n;
    }
    return true;
}

bool SocketConnection::peerClosed() {
    if (_closed) {
        return true;
    }
    struct pollfd pfd;
    pfd.fd = _fd;
    pfd.events = POLLIN | POLLRDHUP;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 0) <= 0) {
        return false;
    }
    if (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) {
        return true;
    }
    if (pfd.revents & POLLIN) {
        char c;
        ssize_t n = ::recv(_fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        return n == 0;
    }
    return false;
}

void SocketConnection::setReadTimeout(int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, (socklen_t)sizeof(tv));
}

void SocketConnection::close() {
    if (!_closed.exchange(true)) {
        // shutdown wakes a thread blocked in recv; the descriptor itself is
        // released in the destructor so it cannot be reused underneath it.
        ::shutdown(_fd, SHUT_RDWR);
    }
}

std::string SocketConnection::peerName() {
    return _peer;
}

// TcpListener

TcpListener::TcpListener() :
    _fd(-1), _port(0)
{
}

TcpListener::~TcpListener() {
    close();
}

void TcpListener::listen(int port) {
    _port = port;
    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        throw MailException(THREADMAIL_ERROR_LISTEN, "socket(AF_INET,SOCK_STREAM) failed: " + std::string(std::strerror(errno)));
    }
    int yes = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);

    if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int last = errno;
        ::close(sock);
        throw MailException(THREADMAIL_ERROR_LISTEN, "bind(0.0.0.0:" + std::to_string(port) + ") failed: " + std::strerror(last));
    }
    if (::listen(sock, 64) < 0) {
        int last = errno;
        ::close(sock);
        throw MailException(THREADMAIL_ERROR_LISTEN, "listen(0.0.0.0:" + std::to_string(port) + ") failed: " + std::strerror(last));
    }

    // Port 0 asks the kernel for any free port; report the one it picked.
    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        _port = ntohs(bound.sin_port);
    }
    _fd = sock;
}

int TcpListener::accept(std::string & peer) {
    while (true) {
        int fd = _fd.load();
        if (fd < 0) {
            return -1;
        }
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int client = ::accept(fd, reinterpret_cast<sockaddr*>(&cli), &len);
        if (client < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            return -1;
        }
        char ipBuf[64] = {};
        const char * ip = inet_ntop(AF_INET, &cli.sin_addr, ipBuf, sizeof(ipBuf));
        peer = std::string(ip ? ip : "?") + ":" + std::to_string(ntohs(cli.sin_port));
        return client;
    }
}

int TcpListener::port() {
    return _port;
}

void TcpListener::close() {
    int fd = _fd.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}
