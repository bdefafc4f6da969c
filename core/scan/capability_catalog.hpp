#pragma once

namespace sonar {
namespace scan {

// Name/description pairs emitted from more than one place. Deduplication is by
// (name, description), so both emitters must use the same text.
struct CapabilityText {
    const char *name;
    const char *description;
};

namespace catalog {
constexpr CapabilityText kPrintDocument{"Print document", "Send a document to the printer"};
constexpr CapabilityText kPrintQueue{"Print queue", "View and manage queued print jobs"};
constexpr CapabilityText kPrinterStatus{"Printer status", "Read printer state and supply levels"};
constexpr CapabilityText kLiveView{"Live view", "Watch the camera's live feed"};
constexpr CapabilityText kCastMedia{"Cast media", "Send media to the player"};
constexpr CapabilityText kBrowseFiles{"Browse files", "Browse files stored on the device"};
constexpr CapabilityText kLogIn{"Log in", "Authenticate to the device's management interface"};
constexpr CapabilityText kWakeDevice{"Wake device", "Send a Wake-on-LAN magic packet"};
constexpr CapabilityText kMonitorAvailability{"Monitor availability", "Track whether the device is online"};
}  // namespace catalog

}  // namespace scan
}  // namespace sonar
