#include "address_classifier.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>

namespace sonar {
namespace scan {

namespace {
constexpr size_t kMinLinkLayerGroups = 6;

bool starts_with_nocase(const std::string &s, const std::string &prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}
}  // namespace

AddressKind AddressClassifier::classify(const std::string &raw) {
    if (is_link_layer(raw)) {
        return AddressKind::LINK_LAYER;
    }
    if (is_ipv4_literal(raw) || is_ipv6_literal(raw)) {
        return AddressKind::IP_LITERAL;
    }
    if (is_local_handle(raw)) {
        return AddressKind::LOCAL_HANDLE;
    }
    return AddressKind::UNKNOWN;
}

bool AddressClassifier::is_link_layer(const std::string &raw) {
    if (raw.empty()) {
        return false;
    }
    // One separator style throughout
    const char sep = raw.find(':') != std::string::npos ? ':' : '-';

    size_t groups = 0;
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t next = raw.find(sep, pos);
        if (next == std::string::npos) {
            next = raw.size();
        }
        if (next - pos != 2) {
            return false;
        }
        if (!std::isxdigit(static_cast<unsigned char>(raw[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(raw[pos + 1]))) {
            return false;
        }
        ++groups;
        pos = next + 1;
    }
    return groups >= kMinLinkLayerGroups;
}

bool AddressClassifier::is_ipv4_literal(const std::string &raw) {
    size_t dots = 0;
    size_t digits = 0;
    int octet = 0;
    for (char c : raw) {
        if (c == '.') {
            if (digits == 0) {
                return false;
            }
            ++dots;
            digits = 0;
            octet = 0;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)) || ++digits > 3) {
            return false;
        }
        octet = octet * 10 + (c - '0');
        if (octet > 255) {
            return false;
        }
    }
    return dots == 3 && digits > 0;
}

bool AddressClassifier::is_ipv6_literal(const std::string &raw) {
    if (raw.find(':') == std::string::npos) {
        return false;
    }
    in6_addr addr{};
    return ::inet_pton(AF_INET6, raw.c_str(), &addr) == 1;
}

bool AddressClassifier::is_local_handle(const std::string &raw) {
    return starts_with_nocase(raw, "CAM:") || raw.rfind("/dev/video", 0) == 0;
}

}  // namespace scan
}  // namespace sonar
