#include "net/udp_transport.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

namespace pitchsync::net {
namespace {

constexpr int kInvalidSocket = -1;
constexpr std::size_t kMaxDatagramBytes = 65535;

std::string ErrnoMessage(const char* prefix, int error_code) {
    return std::string(prefix) + ": " + std::string(std::strerror(error_code));
}

bool SetNonBlocking(int socket_handle, std::string& out_error) {
    const int flags = fcntl(socket_handle, F_GETFL, 0);
    if (flags < 0) {
        out_error = ErrnoMessage("fcntl(F_GETFL) failed", errno);
        return false;
    }

    if (fcntl(socket_handle, F_SETFL, flags | O_NONBLOCK) < 0) {
        out_error = ErrnoMessage("fcntl(F_SETFL) failed", errno);
        return false;
    }

    out_error.clear();
    return true;
}

bool ParseAddress(
    std::string_view host,
    std::uint16_t port,
    sockaddr_in& out_address,
    std::string& out_error) {
    std::memset(&out_address, 0, sizeof(out_address));
    out_address.sin_family = AF_INET;
    out_address.sin_port = htons(port);

    if (host == "0.0.0.0") {
        out_address.sin_addr.s_addr = htonl(INADDR_ANY);
        out_error.clear();
        return true;
    }

    const std::string host_text = host.empty() ? std::string("127.0.0.1") : std::string(host);
    if (inet_pton(AF_INET, host_text.c_str(), &out_address.sin_addr) != 1) {
        out_error = "invalid IPv4 host: " + host_text;
        return false;
    }

    out_error.clear();
    return true;
}

std::string AddressToString(const sockaddr_in& address) {
    char output_buffer[INET_ADDRSTRLEN] = {};
    const char* text = inet_ntop(AF_INET, &address.sin_addr, output_buffer, INET_ADDRSTRLEN);
    if (text == nullptr) {
        return "0.0.0.0";
    }
    return std::string(text);
}

}  // namespace

bool operator==(const UdpEndpoint& lhs, const UdpEndpoint& rhs) {
    return lhs.port == rhs.port && lhs.host == rhs.host;
}

std::string EndpointText(const UdpEndpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

struct UdpTransport::Impl final {
    int socket_handle = kInvalidSocket;
    std::uint16_t local_port = 0;
    std::array<wire::Byte, kMaxDatagramBytes> receive_buffer{};
};

UdpTransport::UdpTransport()
    : impl_(std::make_unique<Impl>()) {}

UdpTransport::~UdpTransport() {
    Close();
}

bool UdpTransport::Open(std::string_view local_host, std::uint16_t local_port, std::string& out_error) {
    Close();

    sockaddr_in bind_address{};
    if (!ParseAddress(local_host, local_port, bind_address, out_error)) {
        return false;
    }

    const int socket_handle = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_handle == kInvalidSocket) {
        out_error = ErrnoMessage("socket creation failed", errno);
        return false;
    }

    if (!SetNonBlocking(socket_handle, out_error)) {
        close(socket_handle);
        return false;
    }

    if (bind(socket_handle, reinterpret_cast<const sockaddr*>(&bind_address), sizeof(bind_address)) != 0) {
        out_error = ErrnoMessage("bind failed", errno);
        close(socket_handle);
        return false;
    }

    sockaddr_in actual_address{};
    socklen_t actual_address_size = sizeof(actual_address);
    if (getsockname(
            socket_handle,
            reinterpret_cast<sockaddr*>(&actual_address),
            &actual_address_size) != 0) {
        out_error = ErrnoMessage("getsockname failed", errno);
        close(socket_handle);
        return false;
    }

    impl_->socket_handle = socket_handle;
    impl_->local_port = ntohs(actual_address.sin_port);
    out_error.clear();
    return true;
}

void UdpTransport::Close() {
    if (impl_ == nullptr) {
        return;
    }

    if (impl_->socket_handle != kInvalidSocket) {
        close(impl_->socket_handle);
        impl_->socket_handle = kInvalidSocket;
    }
    impl_->local_port = 0;
}

bool UdpTransport::IsOpen() const {
    return impl_ != nullptr && impl_->socket_handle != kInvalidSocket;
}

std::uint16_t UdpTransport::LocalPort() const {
    return impl_ != nullptr ? impl_->local_port : 0;
}

bool UdpTransport::SendTo(const UdpEndpoint& endpoint, wire::ByteSpan datagram, std::string& out_error) {
    if (!IsOpen()) {
        out_error = "transport is not open";
        return false;
    }
    if (endpoint.port == 0) {
        out_error = "endpoint port must be non-zero";
        return false;
    }

    sockaddr_in endpoint_address{};
    if (!ParseAddress(endpoint.host, endpoint.port, endpoint_address, out_error)) {
        return false;
    }

    const ssize_t send_result = sendto(
        impl_->socket_handle,
        datagram.data(),
        datagram.size(),
        0,
        reinterpret_cast<const sockaddr*>(&endpoint_address),
        sizeof(endpoint_address));
    if (send_result < 0) {
        out_error = ErrnoMessage("sendto failed", errno);
        return false;
    }

    if (static_cast<std::size_t>(send_result) != datagram.size()) {
        out_error = "sendto failed: partial datagram write";
        return false;
    }

    out_error.clear();
    return true;
}

bool UdpTransport::Receive(wire::ByteBuffer& out_datagram, UdpEndpoint& out_sender, std::string& out_error) {
    if (!IsOpen()) {
        out_error = "transport is not open";
        return false;
    }

    sockaddr_in sender_address{};
    socklen_t sender_address_size = sizeof(sender_address);
    const ssize_t receive_result = recvfrom(
        impl_->socket_handle,
        impl_->receive_buffer.data(),
        impl_->receive_buffer.size(),
        0,
        reinterpret_cast<sockaddr*>(&sender_address),
        &sender_address_size);
    if (receive_result < 0) {
        const int socket_error = errno;
        if (socket_error == EWOULDBLOCK || socket_error == EAGAIN) {
            out_error.clear();
            return false;
        }

        out_error = ErrnoMessage("recvfrom failed", socket_error);
        return false;
    }

    out_datagram.assign(
        impl_->receive_buffer.begin(),
        impl_->receive_buffer.begin() + receive_result);
    out_sender.host = AddressToString(sender_address);
    out_sender.port = ntohs(sender_address.sin_port);
    out_error.clear();
    return true;
}

}  // namespace pitchsync::net
