#include "rsu.hpp"

double calc_rsu(const vector<array<double, 3>>& metal_positions)
{
	if (metal_positions.empty()) return 0;
	const array<double, 3> origin = {};
	return distance(metal_positions.back(), origin);
}

double calc_rsu(const string& conf_id, const double theta, const double delta)
{
	return calc_rsu(calc_metal_positions(conf_id, theta, delta));
}
