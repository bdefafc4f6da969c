#pragma once

#include <optional>
#include <string>
#include <vector>

#include "net/deadline.hpp"
#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Fast TCP port scanner living outside the process.
 *
 * scan_tcp() returns one ProbeResult per requested port, or nullopt when the
 * backend could not produce a trustworthy answer; the port scanner then falls
 * back to its own connect loop.
 */
class IExternalScanner {
public:
    virtual ~IExternalScanner() = default;

    virtual std::string name() const = 0;
    virtual bool available() const = 0;
    virtual std::optional<std::vector<ProbeResult>> scan_tcp(const std::string &host,
                                                             const std::vector<uint16_t> &ports,
                                                             const net::Deadline &deadline) = 0;
};

}  // namespace scan
}  // namespace sonar
