#pragma once
#ifndef RSUANALYZER_RSU_HPP
#define RSUANALYZER_RSU_HPP

#include "ring.hpp"

//! Reduces the metal centers of a ring walked from the origin into its RSU,
//! i.e. the distance between the last metal center and the origin where the walk started.
//! RSU is 0 for a closed ring and grows as the ring fails to close. Returns 0 for an empty ring.
double calc_rsu(const vector<array<double, 3>>& metal_positions);

//! Calculates the RSU of a ring given its conformation ID, tilting angle theta and bridge angle delta in degrees.
//! Throws invalid_argument on a malformed ID or theta.
double calc_rsu(const string& conf_id, const double theta, const double delta);

#endif
