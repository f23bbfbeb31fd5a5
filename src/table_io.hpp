#pragma once
#include "gbcore.hpp"
#include "distance_engine.hpp"
#include <string>

namespace gbcore {

// Header: [id<d>]entries<d>populations<d>feature... ; one row per entry.
// "", NA, missing -> missing; NaN, Inf, -Inf parse to IEEE values.
// A delimiter of 0 selects Axis::delimiter.
template <class Axis>
Container<Axis> read_container(const std::string& path, char delim = 0);

// Same layout as read_container with 0/1 (or true/false) cells; names must
// match `c` exactly. Replaces c.mask.
template <class Axis>
void read_mask(const std::string& path, Container<Axis>& c, char delim = 0);

// Writes tabularise(c): id, entries, populations, features...
template <class Axis>
void write_table(const Container<Axis>& c, const std::string& path, char delim = 0);

template <class Axis>
void write_mask(const Container<Axis>& c, const std::string& path, char delim = 0);

// One "<prefix>.<axis>.<metric>.tsv" (".csv" for ',') per matrix, rows and
// columns labelled with the axis names. Returns the written paths.
std::vector<std::string> write_distances(const DistanceResult& d, const std::string& prefix,
                                         char delim = '\t');

} // namespace gbcore
