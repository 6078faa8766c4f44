#include <limits>
#include <algorithm>
#include "plot.hpp"

array<vector<double>, 3> transpose_to_xyz(const vector<array<double, 3>>& points)
{
	array<vector<double>, 3> xyz;
	for (size_t i = 0; i < 3; ++i)
	{
		xyz[i].reserve(points.size());
		for (const auto& p : points)
		{
			xyz[i].push_back(p[i]);
		}
	}
	return xyz;
}

axis_limits limit_axis(const vector<array<double, 3>>& points, const double margin)
{
	array<double, 3> mn, mx;
	mn.fill(numeric_limits<double>::max());
	mx.fill(numeric_limits<double>::lowest());
	for (const auto& p : points)
	{
		for (size_t i = 0; i < 3; ++i)
		{
			mn[i] = min(mn[i], p[i]);
			mx[i] = max(mx[i], p[i]);
		}
	}

	array<double, 3> center = {};
	double half = 0;
	if (!points.empty())
	{
		for (size_t i = 0; i < 3; ++i)
		{
			center[i] = (mx[i] + mn[i]) * 0.5;
			half = max(half, (mx[i] - mn[i]) * 0.5);
		}
	}
	half += margin;

	axis_limits l;
	for (size_t i = 0; i < 3; ++i)
	{
		l.lower[i] = center[i] - half;
		l.upper[i] = center[i] + half;
	}
	return l;
}
