#include <stdexcept>
#include <sstream>
#include "ligand.hpp"

const array<double, 3> x_axis = { 1, 0, 0 };
const array<double, 3> z_axis = { 0, 0, 1 };

bool is_lig_type(const string& token)
{
	return token == "RR" || token == "RL" || token == "LR" || token == "LL";
}

lig_type parse_lig_type(const string& token)
{
	if (token == "RR") return lig_type::RR;
	if (token == "RL") return lig_type::RL;
	if (token == "LR") return lig_type::LR;
	if (token == "LL") return lig_type::LL;
	throw invalid_argument("Invalid lig_type: " + token);
}

string to_string(const lig_type t)
{
	switch (t)
	{
		case lig_type::RR: return "RR";
		case lig_type::RL: return "RL";
		case lig_type::LR: return "LR";
		case lig_type::LL: return "LL";
	}
	throw invalid_argument("Invalid lig_type");
}

pair<int, int> lig_type_to_signs(const lig_type t)
{
	switch (t)
	{
		case lig_type::RR: return make_pair( 1,  1);
		case lig_type::RL: return make_pair( 1, -1);
		case lig_type::LR: return make_pair(-1,  1);
		case lig_type::LL: return make_pair(-1, -1);
	}
	throw invalid_argument("Invalid lig_type");
}

bool valid_theta(const double theta)
{
	// NaN fails both comparisons.
	return theta >= 0 && theta <= 90;
}

inner_vecs_and_rots calc_inner_vecs_and_rots(const lig_type t, const double theta)
{
	// j and k represent the rotation directions of the two C-C bonds.
	const pair<int, int> signs = lig_type_to_signs(t);
	const int j = signs.first;
	const int k = signs.second;

	inner_vecs_and_rots r;
	r.x_ab_in_system_a = x_axis;
	r.rot_ab1 = vec4_to_qtn4(x_axis, j * theta);
	r.rot_b1b2 = vec4_to_qtn4(z_axis, j * 60);
	r.rot_b2c1 = vec4_to_qtn4(x_axis, k * theta);
	r.x_bc_in_system_a = rotate(compose(r.rot_ab1, r.rot_b1b2), x_axis);

	// For RR and LL, turn C1 upside down so that the z-axis of C2 protrudes towards the front face.
	r.rot_c1c2 = (t == lig_type::RR || t == lig_type::LL) ? vec4_to_qtn4(x_axis, 180) : qtn4id;
	return r;
}

ligand_end calc_lig_end(const lig_type t, const double theta)
{
	if (!valid_theta(theta))
	{
		ostringstream oss;
		oss << "Invalid theta: " << theta;
		throw invalid_argument(oss.str());
	}

	const inner_vecs_and_rots r = calc_inner_vecs_and_rots(t, theta);
	ligand_end e;
	e.x_ac = r.x_ab_in_system_a + r.x_bc_in_system_a;
	e.rot_ac = compose(compose(compose(r.rot_ab1, r.rot_b1b2), r.rot_b2c1), r.rot_c1c2);
	return e;
}

ligand_end calc_lig_end(const string& token, const double theta)
{
	return calc_lig_end(parse_lig_type(token), theta);
}
