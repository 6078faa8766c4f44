#pragma once
#ifndef RSUANALYZER_PLOT_HPP
#define RSUANALYZER_PLOT_HPP

#include <vector>
#include "array.hpp"

//! Represents the limits of the 3 axes of a 3D view.
class axis_limits
{
public:
	array<double, 3> lower; //!< Lower limits of x, y and z.
	array<double, 3> upper; //!< Upper limits of x, y and z.
};

//! Transposes a list of points into the lists of their x, y and z coordinates.
array<vector<double>, 3> transpose_to_xyz(const vector<array<double, 3>>& points);

//! Returns cubic axis limits centered on the bounding box of the points, with the same extent along x, y and z
//! so that a view of 1:1:1 box aspect is not distorted. The half width is the largest half span plus margin.
//! An empty list yields [-margin, margin] on every axis.
axis_limits limit_axis(const vector<array<double, 3>>& points, const double margin);

#endif
