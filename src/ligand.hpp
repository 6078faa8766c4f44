#pragma once
#ifndef RSUANALYZER_LIGAND_HPP
#define RSUANALYZER_LIGAND_HPP

#include <string>
#include <utility>
#include "array.hpp"

//! Rotation directions of the two C-C bonds of a ligand. R means clockwise, L means counterclockwise.
enum class lig_type { RR, RL, LR, LL };

//! Returns true if a 2-character token names a ligand type.
bool is_lig_type(const string& token);

//! Parses a ligand type token, e.g. "RL". Throws invalid_argument on anything else.
lig_type parse_lig_type(const string& token);

//! Returns the 2-character token of a ligand type.
string to_string(const lig_type t);

//! Returns the signs of the two rotation directions, e.g. RL => (1, -1).
pair<int, int> lig_type_to_signs(const lig_type t);

//! Represents the intermediate vectors and rotations along the chain A -> B1 -> B2 -> C1 -> C2 of a ligand.
class inner_vecs_and_rots
{
public:
	array<double, 3> x_ab_in_system_a; //!< Position vector of point B measured from coordinate system A.
	array<double, 3> x_bc_in_system_a; //!< Vector from B to C measured from coordinate system A.
	array<double, 4> rot_ab1; //!< Rotation from coordinate system A to B1.
	array<double, 4> rot_b1b2; //!< Rotation from B1 to B2.
	array<double, 4> rot_b2c1; //!< Rotation from B2 to C1.
	array<double, 4> rot_c1c2; //!< Rotation from C1 to C2.
};

//! Represents the far end of a ligand seen from its near end.
class ligand_end
{
public:
	array<double, 3> x_ac; //!< Position vector of point C2 measured from coordinate system A.
	array<double, 4> rot_ac; //!< Rotation from coordinate system A to C2.
};

//! Returns true if theta is a valid tilting angle, i.e. within [0, 90] degrees.
bool valid_theta(const double theta);

//! Calculates the inner vectors and rotations of a ligand tilted by theta degrees.
inner_vecs_and_rots calc_inner_vecs_and_rots(const lig_type t, const double theta);

//! Calculates the position and orientation of coordinate system C2 of a ligand relative to its coordinate system A.
//! Throws invalid_argument if theta lies outside [0, 90].
ligand_end calc_lig_end(const lig_type t, const double theta);

//! Calculates the ligand end for a ligand type token. Throws invalid_argument on an unknown token.
ligand_end calc_lig_end(const string& token, const double theta);

#endif
