#pragma once

#include <string>

#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Maps a raw address string to the kind that selects the probe strategy.
 *
 * Rules, first match wins:
 * - six or more ':'/'-' separated groups of exactly two hex digits: LINK_LAYER
 * - dotted-quad IPv4 with 0..255 octets, or an IPv6 literal: IP_LITERAL
 * - "CAM:" (any case) or "/dev/video" prefix: LOCAL_HANDLE
 * - anything else: UNKNOWN (treated as a host name by the engine)
 *
 * Pure and stateless; never throws.
 */
class AddressClassifier {
public:
    static AddressKind classify(const std::string &raw);

    static bool is_link_layer(const std::string &raw);
    static bool is_ipv4_literal(const std::string &raw);
    static bool is_ipv6_literal(const std::string &raw);
    static bool is_local_handle(const std::string &raw);
};

}  // namespace scan
}  // namespace sonar
