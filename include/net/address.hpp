#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring> // memset
#include <netinet/in.h>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>

namespace pasture {

namespace net {


/// IPv4 socket address.
class Address
{
public:
    /*
    A std::string_view doesn't provide a conversion to a const char* because it doesn't store a null-terminated string.
    See https://stackoverflow.com/questions/48081436/how-you-convert-a-stdstring-view-to-a-const-char
    */
    static constexpr std::string_view any_ipv4{"0.0.0.0\0"};
    static constexpr std::string_view loopback_ipv4{"127.0.0.1\0"};

    Address() noexcept {
        std::memset(&addr_, 0, sizeof(addr_));
        addr_len_ = sizeof(addr_);
    }

    /// Throws std::invalid_argument when `ip_addr` is not a dotted quad.
    Address(const char* ip_addr, uint16_t port)
        : Address()
    {
        addr_.sin_family = AF_INET;
        addr_.sin_port = htons(port);
        if (inet_pton(AF_INET, ip_addr, &addr_.sin_addr) != 1)
            throw std::invalid_argument(std::string("Address: invalid IPv4 address ") + ip_addr);
    }

    Address(const Address&) = default;
    Address& operator=(const Address&) = default;

    struct sockaddr* sockaddr() noexcept { return reinterpret_cast<struct sockaddr*>(&addr_); }

    uint16_t port() const noexcept { return ntohs(addr_.sin_port); }

    std::string ip_address() const {
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr_.sin_addr, ip, INET_ADDRSTRLEN);
        return ip;
    }

    socklen_t* len() noexcept { return &addr_len_; }

    std::string to_string() const {
        return ip_address() + ":" + std::to_string(port());
    }

    friend std::ostream& operator<<(std::ostream& os, const Address& addr) {
        os << addr.to_string();
        return os;
    }

private:
    struct sockaddr_in addr_;
    socklen_t addr_len_;
};


inline Address make_any_address_v4(uint16_t port) {
    return Address{Address::any_ipv4.data(), port};
}

inline Address make_loopback_v4(uint16_t port) {
    return Address{Address::loopback_ipv4.data(), port};
}

} // namespace net

} // namespace pasture
