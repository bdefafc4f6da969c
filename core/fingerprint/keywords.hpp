#pragma once

#include <map>
#include <string>
#include <vector>

#include "scan/types.hpp"

namespace sonar {
namespace fingerprint {

// Keyword table for content-based device hints
const std::map<scan::Archetype, std::vector<std::string>> &archetype_keywords();

// Archetypes whose keywords appear in text (case-insensitive), each with the first keyword found
std::map<scan::Archetype, std::string> match_keywords(const std::string &text);

// Adds hint_<archetype>=<first matching keyword> details for every match
void add_hint_details(const std::string &text, std::map<std::string, std::string> &details);

// Lowercase ASCII copy
std::string to_lower(const std::string &s);

// Trim whitespace and strip non-printable bytes
std::string printable(const std::string &s, size_t max_len = 200);

}  // namespace fingerprint
}  // namespace sonar
