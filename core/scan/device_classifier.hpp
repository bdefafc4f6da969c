#pragma once

#include <array>
#include <optional>
#include <set>
#include <vector>

#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Scores services and open ports against the device archetypes.
 *
 * Points per archetype:
 * - content keyword hint (hint_<archetype> detail): 5
 * - service name match: per-service table, typically 3
 * - bare open port: 1 per archetype the port suggests
 *
 * The winner is the strictly highest total; ties go to the earlier archetype
 * in kArchetypePriority. All zeros means no archetype. Pure and deterministic.
 */
class DeviceClassifier {
public:
    using Scores = std::array<int, kArchetypeCount>;

    static constexpr int kKeywordPoints = 5;
    static constexpr int kPortPoints = 1;

    static Scores score(const std::vector<ServiceDescriptor> &services, const std::set<uint16_t> &open_ports);
    static std::optional<Archetype> pick(const Scores &scores);

    static std::optional<Archetype> classify(const std::vector<ServiceDescriptor> &services,
                                             const std::set<uint16_t> &open_ports) {
        return pick(score(services, open_ports));
    }

    static int score_of(const Scores &scores, Archetype archetype) {
        return scores[static_cast<size_t>(archetype)];
    }
};

}  // namespace scan
}  // namespace sonar
