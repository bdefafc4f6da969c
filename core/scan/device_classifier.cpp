#include "device_classifier.hpp"

#include <map>
#include <string>
#include <utility>

namespace sonar {
namespace scan {

namespace {

using A = Archetype;
using Weighted = std::vector<std::pair<Archetype, int>>;

const std::map<std::string, Weighted> &service_table() {
    static const std::map<std::string, Weighted> table = {
        {"HTTP", {{A::SERVER, 2}, {A::ROUTER, 1}, {A::EMBEDDED, 1}}},
        {"HTTPS", {{A::SERVER, 2}, {A::ROUTER, 1}, {A::EMBEDDED, 1}}},
        {"SSH", {{A::WORKSTATION, 3}, {A::SERVER, 3}}},
        {"FTP", {{A::STORAGE, 3}, {A::SERVER, 2}}},
        {"SMB", {{A::STORAGE, 3}, {A::WORKSTATION, 2}}},
        {"RTSP", {{A::CAMERA, 3}, {A::MEDIA, 2}}},
        {"MQTT", {{A::EMBEDDED, 3}}},
        {"MQTTS", {{A::EMBEDDED, 3}}},
        {"Telnet", {{A::EMBEDDED, 3}, {A::ROUTER, 2}}},
        {"VNC", {{A::WORKSTATION, 3}}},
        {"RDP", {{A::WORKSTATION, 3}}},
        {"IPP", {{A::PRINTER, 3}}},
        {"JetDirect", {{A::PRINTER, 3}}},
        {"LPD", {{A::PRINTER, 3}}},
        {"SNMP", {{A::ROUTER, 3}, {A::PRINTER, 2}}},
        {"DNS", {{A::ROUTER, 3}, {A::SERVER, 2}}},
    };
    return table;
}

const std::map<uint16_t, std::vector<Archetype>> &port_table() {
    static const std::map<uint16_t, std::vector<Archetype>> table = {
        {21, {A::STORAGE, A::SERVER}},     {22, {A::WORKSTATION, A::SERVER}}, {23, {A::EMBEDDED, A::ROUTER}},
        {25, {A::SERVER}},                 {53, {A::ROUTER, A::SERVER}},      {80, {A::ROUTER, A::SERVER}},
        {139, {A::STORAGE, A::WORKSTATION}}, {161, {A::ROUTER, A::PRINTER}},  {443, {A::ROUTER, A::SERVER}},
        {445, {A::STORAGE, A::WORKSTATION}}, {515, {A::PRINTER}},             {548, {A::STORAGE}},
        {554, {A::CAMERA}},                {631, {A::PRINTER}},               {1883, {A::EMBEDDED}},
        {3389, {A::WORKSTATION}},          {5000, {A::STORAGE}},              {5001, {A::STORAGE}},
        {5900, {A::WORKSTATION}},          {8000, {A::CAMERA}},               {8008, {A::MEDIA}},
        {8080, {A::SERVER}},               {8443, {A::SERVER}},               {8554, {A::CAMERA}},
        {8883, {A::EMBEDDED}},             {9100, {A::PRINTER}},              {32400, {A::MEDIA}},
        {49152, {A::MEDIA}},
    };
    return table;
}

constexpr const char *kHintPrefix = "hint_";

}  // namespace

DeviceClassifier::Scores DeviceClassifier::score(const std::vector<ServiceDescriptor> &services,
                                                 const std::set<uint16_t> &open_ports) {
    Scores scores{};

    for (const auto &service : services) {
        auto it = service_table().find(service.service_name);
        if (it != service_table().end()) {
            for (const auto &[archetype, points] : it->second) {
                scores[static_cast<size_t>(archetype)] += points;
            }
        }

        for (const auto &[key, value] : service.details) {
            if (key.rfind(kHintPrefix, 0) != 0) {
                continue;
            }
            auto archetype = archetype_from_string(key.substr(std::char_traits<char>::length(kHintPrefix)));
            if (archetype) {
                scores[static_cast<size_t>(*archetype)] += kKeywordPoints;
            }
        }
    }

    for (uint16_t port : open_ports) {
        auto it = port_table().find(port);
        if (it == port_table().end()) {
            continue;
        }
        for (Archetype archetype : it->second) {
            scores[static_cast<size_t>(archetype)] += kPortPoints;
        }
    }
    return scores;
}

std::optional<Archetype> DeviceClassifier::pick(const Scores &scores) {
    std::optional<Archetype> best;
    int best_score = 0;
    // Priority order, strict comparison: the earlier archetype keeps a tie
    for (Archetype archetype : kArchetypePriority) {
        const int value = scores[static_cast<size_t>(archetype)];
        if (value > best_score) {
            best = archetype;
            best_score = value;
        }
    }
    return best;
}

}  // namespace scan
}  // namespace sonar
