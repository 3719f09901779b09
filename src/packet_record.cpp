#include "packet_record.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array<std::string_view, 9> kHttpMethods = {
    "GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS", "PATCH", "CONNECT", "TRACE"};

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

HttpRequestInfo parseHttpRequest(std::string_view payload)
{
    HttpRequestInfo info;

    size_t line_end = payload.find('\n');
    std::string_view request_line = trim(payload.substr(0, line_end));

    size_t first_space = request_line.find(' ');
    if (first_space == std::string_view::npos) {
        return info;
    }
    std::string_view method = request_line.substr(0, first_space);
    if (std::find(kHttpMethods.begin(), kHttpMethods.end(), method) == kHttpMethods.end()) {
        return info;
    }

    std::string_view rest = request_line.substr(first_space + 1);
    size_t second_space = rest.rfind(" HTTP/");
    std::string_view uri = trim(second_space == std::string_view::npos ? rest : rest.substr(0, second_space));

    info.method = std::string(method);
    info.uri = std::string(uri);

    // Header lines up to the blank line
    while (line_end != std::string_view::npos) {
        size_t start = line_end + 1;
        line_end = payload.find('\n', start);
        std::string_view line = trim(payload.substr(start, line_end == std::string_view::npos
                                                                ? std::string_view::npos
                                                                : line_end - start));
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon != std::string_view::npos && iequals(trim(line.substr(0, colon)), "User-Agent")) {
            info.user_agent = std::string(trim(line.substr(colon + 1)));
            break;
        }
    }

    return info;
}

std::string protocolToString(Protocol protocol)
{
    switch (protocol) {
        case Protocol::Tcp: return "TCP";
        case Protocol::Udp: return "UDP";
        case Protocol::Icmp: return "ICMP";
        default: return "OTHER";
    }
}

Protocol protocolFromIpProto(std::uint8_t ip_proto)
{
    switch (ip_proto) {
        case 6: return Protocol::Tcp;
        case 17: return Protocol::Udp;
        case 1:
        case 58: return Protocol::Icmp;
        default: return Protocol::Other;
    }
}
