#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

#include "errors.h"
#include "protocol.h"

// Default UDP port of v3-v5 wifi gateways. Some hardware revisions listen
// on 50000 instead.
static constexpr uint16_t MILIGHT_DEFAULT_PORT = 8899;

// Fire-and-forget datagram writer. The protocol has no response channel, so
// there is nothing to receive.
class DatagramSender {
public:
    virtual ~DatagramSender() = default;

    // Send one frame to host:port.
    // Throws TransportError on failure.
    virtual void send(const uint8_t data[MILIGHT_FRAME_SIZE],
                      const std::string& host, uint16_t port) = 0;
};

// POSIX UDP sender. A socket is opened for each send() and closed again
// before returning, whether or not the write succeeded.
class UdpSender : public DatagramSender {
public:
    UdpSender() = default;

    // Non-copyable
    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    void send(const uint8_t data[MILIGHT_FRAME_SIZE],
              const std::string& host, uint16_t port) override;
};

// Prints every frame as "--> 42 00 55  host:port" and forwards it to the
// wrapped sender. With no inner sender frames are only printed (dry run).
class EchoSender : public DatagramSender {
public:
    EchoSender(std::ostream& out, std::shared_ptr<DatagramSender> inner);

    void send(const uint8_t data[MILIGHT_FRAME_SIZE],
              const std::string& host, uint16_t port) override;

    int frames_sent() const { return _frames; }

private:
    std::ostream&                   _out;
    std::shared_ptr<DatagramSender> _inner;
    int                             _frames = 0;
};
