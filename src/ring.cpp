#include "ring.hpp"

ring walk(const conformation& conf, const double theta, const double delta)
{
	const size_t n = conf.size();
	ring r;
	r.metal_positions.reserve(n);
	r.frags_of_ligs.reserve(n);
	r.frames.reserve(n + 1);

	frame f; // Coordinate system A of the current ligand, initialized to the absolute system.
	r.frames.push_back(f);
	for (const auto& u : conf)
	{
		const ligand_end e = calc_lig_end(u.lig, theta);
		const inner_vecs_and_rots v = calc_inner_vecs_and_rots(u.lig, theta);

		// Backbone atoms A, B and C of the current ligand.
		const array<double, 3> a = f.position;
		const array<double, 3> b = f.to_absolute(v.x_ab_in_system_a);
		const array<double, 3> c = f.to_absolute(e.x_ac);
		r.frags_of_ligs.push_back({ { a, b }, { b, c } });

		// The metal center sits at the end of the ligand.
		r.metal_positions.push_back(c);

		// Move on to the coordinate system A of the next ligand across the metal center.
		f.position = c;
		f.orientation = normalize(compose(compose(f.orientation, e.rot_ac), bridge_rotation(u.bridge, delta)));
		r.frames.push_back(f);
	}
	return r;
}

vector<array<double, 3>> calc_metal_positions(const string& conf_id, const double theta, const double delta)
{
	return walk(conformation(conf_id), theta, delta).metal_positions;
}

vector<vector<fragment>> calc_carbon_positions(const string& conf_id, const double theta, const double delta)
{
	return walk(conformation(conf_id), theta, delta).frags_of_ligs;
}
