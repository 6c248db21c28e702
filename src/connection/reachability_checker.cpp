#include "reachability_checker.hpp"
#include "host_port.hpp"
#include "core/logger.hpp"

#include <memory>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace mssql_conncheck::connection {

namespace {

#ifdef _WIN32
using NativeSocket = SOCKET;
const NativeSocket INVALID_NATIVE_SOCKET = INVALID_SOCKET;

int last_socket_error() { return ::WSAGetLastError(); }
void close_native(NativeSocket s) { ::closesocket(s); }
bool connect_in_progress(int err) { return err == WSAEWOULDBLOCK; }
int poll_one(pollfd& pfd, int timeout_ms) { return ::WSAPoll(&pfd, 1, timeout_ms); }

bool set_nonblocking(NativeSocket s) {
    u_long mode = 1;
    return ::ioctlsocket(s, FIONBIO, &mode) == 0;
}

std::string error_text(int err) {
    char buffer[512] = {0};
    DWORD length = ::FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, nullptr,
                                    static_cast<DWORD>(err), 0, buffer, sizeof(buffer), nullptr);
    std::string text(buffer, length);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return "ERROR: " + (text.empty() ? "socket error " + std::to_string(err) : text);
}
#else
using NativeSocket = int;
const NativeSocket INVALID_NATIVE_SOCKET = -1;

int last_socket_error() { return errno; }
void close_native(NativeSocket s) { ::close(s); }
bool connect_in_progress(int err) { return err == EINPROGRESS; }
int poll_one(pollfd& pfd, int timeout_ms) { return ::poll(&pfd, 1, timeout_ms); }

bool set_nonblocking(NativeSocket s) {
    int flags = ::fcntl(s, F_GETFL, 0);
    return flags >= 0 && ::fcntl(s, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string error_text(int err) {
    return std::string("ERROR: ") + std::strerror(err);
}
#endif

// RAII owner of a socket descriptor
class SocketHandle {
public:
    explicit SocketHandle(NativeSocket fd) : fd_(fd) {}
    ~SocketHandle() {
        if (valid()) {
            close_native(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    NativeSocket get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ != INVALID_NATIVE_SOCKET; }

private:
    NativeSocket fd_;
};

// nullopt on success, otherwise the failure description for this address
std::optional<std::string> connect_with_timeout(const addrinfo& addr, std::chrono::seconds timeout) {
    SocketHandle sock(::socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol));
    if (!sock.valid()) {
        return error_text(last_socket_error());
    }

    if (!set_nonblocking(sock.get())) {
        return error_text(last_socket_error());
    }

    if (::connect(sock.get(), addr.ai_addr, static_cast<socklen_t>(addr.ai_addrlen)) == 0) {
        return std::nullopt;
    }
    int err = last_socket_error();
    if (!connect_in_progress(err)) {
        return error_text(err);
    }

    pollfd pfd{};
    pfd.fd = sock.get();
    pfd.events = POLLOUT;

    auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    int ready = poll_one(pfd, static_cast<int>(timeout_ms));
    if (ready == 0) {
        return std::string("ERROR: timed out");
    }
    if (ready < 0) {
        return error_text(last_socket_error());
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &len) != 0) {
        return error_text(last_socket_error());
    }
    if (so_error != 0) {
        return error_text(so_error);
    }
    return std::nullopt;
}

} // anonymous namespace

TcpReachabilityChecker::TcpReachabilityChecker() {
#ifdef _WIN32
    WSADATA data;
    startup_error_ = ::WSAStartup(MAKEWORD(2, 2), &data);
    if (startup_error_ != 0) {
        LOG_WARN("WSAStartup failed: " + std::to_string(startup_error_));
    }
#endif
}

TcpReachabilityChecker::~TcpReachabilityChecker() {
#ifdef _WIN32
    if (startup_error_ == 0) {
        ::WSACleanup();
    }
#endif
}

std::optional<std::string> TcpReachabilityChecker::check(const std::string& host, const std::string& port,
                                                          std::chrono::seconds timeout) {
    if (startup_error_ != 0) {
        return error_text(startup_error_);
    }
    if (!is_valid_port(port)) {
        return "ERROR: invalid port: " + port;
    }
    // poll() treats a negative timeout as infinite
    if (timeout.count() <= 0) {
        return "ERROR: invalid timeout: " + std::to_string(timeout.count()) + "s";
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw_result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &raw_result);
    if (rc != 0 || !raw_result) {
        return std::string("ERROR: ") + ::gai_strerror(rc);
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> result(raw_result, &::freeaddrinfo);

    std::optional<std::string> last_error;
    for (const addrinfo* addr = result.get(); addr != nullptr; addr = addr->ai_next) {
        last_error = connect_with_timeout(*addr, timeout);
        if (!last_error) {
            LOG_DEBUG("TCP connection to " + host + "," + port + " succeeded");
            return std::nullopt;
        }
    }

    LOG_DEBUG("TCP connection to " + host + "," + port + " failed: " + *last_error);
    return last_error;
}

} // namespace mssql_conncheck::connection
