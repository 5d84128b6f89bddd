#pragma once

#include "wire/byte_io.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pitchsync::net {

struct UdpEndpoint final {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;
};

bool operator==(const UdpEndpoint& lhs, const UdpEndpoint& rhs);

std::string EndpointText(const UdpEndpoint& endpoint);

// Non-blocking IPv4 datagram socket.
class UdpTransport final {
public:
    UdpTransport();
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    // Port 0 binds an ephemeral port; LocalPort() reports the one chosen.
    bool Open(std::string_view local_host, std::uint16_t local_port, std::string& out_error);
    void Close();

    bool IsOpen() const;
    std::uint16_t LocalPort() const;

    bool SendTo(const UdpEndpoint& endpoint, wire::ByteSpan datagram, std::string& out_error);

    // Returns false with an empty error when nothing is waiting.
    bool Receive(wire::ByteBuffer& out_datagram, UdpEndpoint& out_sender, std::string& out_error);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pitchsync::net
