#ifndef GROWTH_DATA_HPP
#define GROWTH_DATA_HPP

#include <cmath>
#include <functional> // For std::hash
#include <map>
#include <ostream>
#include <string>
#include <tuple>
#include <utility> // For std::move
#include <vector>

namespace growth_fit {

/**
 * @brief One density measurement of a growth series.
 *
 * A missing measurement is stored as a quiet NaN density; it keeps its place in the
 * series but never takes part in fitting.
 */
struct Observation {
    double time = 0.0;    ///< Time of measurement (any consistent unit, >= 0).
    double density = 0.0; ///< Population density, e.g. optical density. NaN when missing.

    Observation() = default;
    Observation(double t, double d)
      : time(t)
      , density(d) {}

    bool has_density() const { return !std::isnan(density); }
};

/**
 * @brief Identifies one organism / experiment / replicate combination.
 *
 * The three fields are opaque identifiers. Ordering is lexicographic so the key can be
 * used directly in ordered containers such as std::map.
 */
struct GroupKey {
    std::string organism_id;
    std::string experiment_id;
    std::string replicate_id;

    GroupKey() = default;
    GroupKey(std::string organism, std::string experiment, std::string replicate)
      : organism_id(std::move(organism))
      , experiment_id(std::move(experiment))
      , replicate_id(std::move(replicate)) {}

    bool operator==(const GroupKey &other) const {
        return organism_id == other.organism_id && experiment_id == other.experiment_id &&
               replicate_id == other.replicate_id;
    }

    bool operator!=(const GroupKey &other) const { return !(*this == other); }

    bool operator<(const GroupKey &other) const {
        return std::tie(organism_id, experiment_id, replicate_id) <
               std::tie(other.organism_id, other.experiment_id, other.replicate_id);
    }
};

inline std::ostream &
operator<<(std::ostream &os, const GroupKey &key) {
    os << key.organism_id << "/" << key.experiment_id << "/" << key.replicate_id;
    return os;
}

/// Time-ordered observations of one group.
using Series = std::vector<Observation>;

/// All groups of an experiment, keyed by group identity.
using GroupedSeries = std::map<GroupKey, Series>;

/**
 * @brief An observation together with its death-phase flag.
 */
struct AnnotatedObservation {
    Observation observation;
    bool death_phase = false;
};

} // namespace growth_fit

// Specialization of std::hash for GroupKey (allows use in std::unordered_map)
namespace std {
template<>
struct hash<growth_fit::GroupKey> {
    std::size_t operator()(const growth_fit::GroupKey &key) const {
        std::size_t seed = std::hash<std::string>{}(key.organism_id);
        seed ^= std::hash<std::string>{}(key.experiment_id) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= std::hash<std::string>{}(key.replicate_id) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};
} // namespace std

#endif // GROWTH_DATA_HPP
