#include "udp.h"

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Closes the wrapped descriptor when it goes out of scope.
struct SocketGuard {
    int fd = -1;
    ~SocketGuard() {
        if (fd >= 0) ::close(fd);
    }
};

struct AddrInfoGuard {
    addrinfo* res = nullptr;
    ~AddrInfoGuard() {
        if (res) freeaddrinfo(res);
    }
};

static std::string endpoint_name(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

// -----------------------------------------------------------------------
// UdpSender
// -----------------------------------------------------------------------

void UdpSender::send(const uint8_t data[MILIGHT_FRAME_SIZE],
                     const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    AddrInfoGuard addr;
    int r = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &addr.res);
    if (r != 0 || !addr.res) {
        throw TransportError(
            "Could not resolve gateway " + endpoint_name(host, port) + ": " +
            gai_strerror(r));
    }

    SocketGuard sock;
    sock.fd = ::socket(addr.res->ai_family, addr.res->ai_socktype, addr.res->ai_protocol);
    if (sock.fd < 0) {
        throw TransportError(
            std::string("Failed to create UDP socket: ") + std::strerror(errno));
    }

    ssize_t sent = ::sendto(sock.fd, data, MILIGHT_FRAME_SIZE, 0,
                            addr.res->ai_addr, addr.res->ai_addrlen);
    if (sent < 0) {
        throw TransportError(
            "sendto " + endpoint_name(host, port) + " failed: " + std::strerror(errno));
    }
    if (sent != MILIGHT_FRAME_SIZE) {
        throw TransportError(
            "Incomplete send to " + endpoint_name(host, port) + ": wrote " +
            std::to_string(sent) + " bytes, expected " +
            std::to_string(MILIGHT_FRAME_SIZE));
    }
}

// -----------------------------------------------------------------------
// EchoSender
// -----------------------------------------------------------------------

EchoSender::EchoSender(std::ostream& out, std::shared_ptr<DatagramSender> inner)
    : _out(out), _inner(std::move(inner)) {}

void EchoSender::send(const uint8_t data[MILIGHT_FRAME_SIZE],
                      const std::string& host, uint16_t port) {
    std::ostringstream line;
    line << "--> ";
    hexdump_bytes(line, data, MILIGHT_FRAME_SIZE);
    line << "  " << endpoint_name(host, port);
    if (!_inner) line << "  (dry run)";
    _out << line.str() << "\n";

    ++_frames;
    if (_inner) _inner->send(data, host, port);
}
