#pragma once
#ifndef RSUANALYZER_RING_HPP
#define RSUANALYZER_RING_HPP

#include "conformation.hpp"

//! Represents a local coordinate system by its origin and orientation in the absolute system.
class frame
{
public:
	array<double, 3> position; //!< Origin in absolute coordinates.
	array<double, 4> orientation; //!< Orientation of the local system, rotating local vectors into the absolute system.

	//! Constructs the absolute coordinate system itself.
	frame() : position{}, orientation(qtn4id) {}

	//! Transforms a point in local coordinates into absolute coordinates.
	array<double, 3> to_absolute(const array<double, 3>& local) const
	{
		return position + rotate(orientation, local);
	}
};

//! A polyline of backbone atoms.
typedef vector<array<double, 3>> fragment;

//! Represents the reconstructed geometry of a ring.
class ring
{
public:
	vector<array<double, 3>> metal_positions; //!< Metal centers, one per ligand, in ligand order. The chain starts at the origin.
	vector<vector<fragment>> frags_of_ligs; //!< Backbone fragments of each ligand, in ligand order.
	vector<frame> frames; //!< Coordinate system A of each ligand, followed by the system after the last bridge.
};

//! Walks around a ring ligand by ligand, accumulating the absolute positions of metal centers and backbone atoms.
//! Closure is not enforced; an open chain is returned for a ring that does not close.
//! Throws invalid_argument if theta lies outside [0, 90].
ring walk(const conformation& conf, const double theta, const double delta);

//! Calculates metal positions from a conformation ID. Throws invalid_argument on a malformed ID or theta.
vector<array<double, 3>> calc_metal_positions(const string& conf_id, const double theta, const double delta);

//! Calculates backbone fragments of every ligand from a conformation ID. Throws invalid_argument on a malformed ID or theta.
vector<vector<fragment>> calc_carbon_positions(const string& conf_id, const double theta, const double delta);

#endif
