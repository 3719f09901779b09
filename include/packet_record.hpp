#ifndef PACKET_RECORD_HPP
#define PACKET_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

enum class Protocol : std::uint8_t {
    Other = 0,
    Tcp = 1,
    Udp = 2,
    Icmp = 3
};

// TCP flag bits as carried in PacketRecord::tcp_flags
namespace tcp_flags {
    constexpr std::uint8_t FIN = 0x01;
    constexpr std::uint8_t SYN = 0x02;
    constexpr std::uint8_t RST = 0x04;
    constexpr std::uint8_t PSH = 0x08;
    constexpr std::uint8_t ACK = 0x10;
}

// A parsed packet handed over by the capture layer. Treated as read-only
// once it enters the pipeline.
struct PacketRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string src_ip;
    std::string dst_ip;
    std::uint16_t src_port = 0;
    std::uint16_t dst_port = 0;
    Protocol protocol = Protocol::Other;
    std::string payload;           // raw bytes
    std::uint8_t tcp_flags = 0;
    std::size_t size = 0;          // bytes on the wire

    bool is_tcp() const { return protocol == Protocol::Tcp; }
    bool is_udp() const { return protocol == Protocol::Udp; }
    bool has_flag(std::uint8_t flag) const { return (tcp_flags & flag) != 0; }
};

struct HttpRequestInfo {
    std::string method;
    std::string uri;
    std::string user_agent;

    bool is_request() const { return !method.empty(); }
};

/**
 * @brief Best-effort parse of an HTTP/1.x request line and User-Agent header
 *
 * Returns empty fields for anything that does not look like a request.
 */
HttpRequestInfo parseHttpRequest(std::string_view payload);

std::string protocolToString(Protocol protocol);

// IANA protocol number (6, 17, 1/58) to Protocol
Protocol protocolFromIpProto(std::uint8_t ip_proto);

#endif // PACKET_RECORD_HPP
