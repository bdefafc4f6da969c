#include "keywords.hpp"

#include <algorithm>
#include <cctype>

namespace sonar {
namespace fingerprint {

using scan::Archetype;

const std::map<Archetype, std::vector<std::string>> &archetype_keywords() {
    static const std::map<Archetype, std::vector<std::string>> table = {
        {Archetype::ROUTER,
         {"router", "gateway", "wireless", "openwrt", "dd-wrt", "tp-link", "netgear", "linksys", "mikrotik", "routeros",
          "ubiquiti", "edgeos", "fritz!box", "asuswrt", "pfsense"}},
        {Archetype::PRINTER,
         {"printer", "toner", "ink", "cups", "jetdirect", "laserjet", "epson", "brother", "canon", "xerox"}},
        {Archetype::CAMERA,
         {"camera", "webcam", "ipcam", "nvr", "dvr", "hikvision", "dahua", "axis", "onvif", "live view", "snapshot"}},
        {Archetype::STORAGE,
         {"nas", "synology", "qnap", "diskstation", "raid", "freenas", "truenas", "file station"}},
        {Archetype::MEDIA,
         {"plex", "jellyfin", "emby", "kodi", "dlna", "roku", "chromecast", "airplay", "sonos", "media player"}},
    };
    return table;
}

std::string to_lower(const std::string &s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

namespace {

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

// Short keywords ("ink", "nas", "nvr") must stand alone to avoid matching inside words
bool contains_keyword(const std::string &haystack, const std::string &keyword) {
    const bool needs_boundary = keyword.size() <= 4;
    size_t pos = haystack.find(keyword);
    while (pos != std::string::npos) {
        if (!needs_boundary) {
            return true;
        }
        const bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
        const size_t end = pos + keyword.size();
        const bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = haystack.find(keyword, pos + 1);
    }
    return false;
}

}  // namespace

std::map<Archetype, std::string> match_keywords(const std::string &text) {
    std::map<Archetype, std::string> matched;
    const std::string lowered = to_lower(text);
    for (const auto &[archetype, words] : archetype_keywords()) {
        const auto hit = std::find_if(words.begin(), words.end(),
                                      [&lowered](const std::string &word) { return contains_keyword(lowered, word); });
        if (hit != words.end()) {
            matched.emplace(archetype, *hit);
        }
    }
    return matched;
}

void add_hint_details(const std::string &text, std::map<std::string, std::string> &details) {
    for (const auto &[archetype, word] : match_keywords(text)) {
        details.emplace(std::string("hint_") + scan::archetype_to_string(archetype), word);
    }
}

std::string printable(const std::string &s, size_t max_len) {
    std::string out;
    for (char c : s) {
        if (out.size() >= max_len) {
            break;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isprint(uc)) {
            out.push_back(c);
        } else if (c == '\n' || c == '\r' || c == '\t') {
            out.push_back(' ');
        }
    }
    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "";
    }
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

}  // namespace fingerprint
}  // namespace sonar
