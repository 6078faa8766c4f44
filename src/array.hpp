#pragma once
#ifndef RSUANALYZER_ARRAY_HPP
#define RSUANALYZER_ARRAY_HPP

#include <array>
using namespace std;

const array<double, 4> qtn4id = { 1, 0, 0, 0 }; //!< Identity quaternion.

//! Returns the square norm of a vector.
double norm_sqr(const array<double, 3>& a);

//! Returns the square norm of a quaternion.
double norm_sqr(const array<double, 4>& a);

//! Returns the norm of a vector.
double norm(const array<double, 3>& a);

//! Returns the norm of a quaternion.
double norm(const array<double, 4>& a);

//! Returns true if the norm of a vector is approximately 1.
bool normalized(const array<double, 3>& a);

//! Returns true if the norm of a quaternion is approximately 1.
bool normalized(const array<double, 4>& a);

//! Normalizes a quaternion.
array<double, 4> normalize(const array<double, 4>& a);

//! Elementwise adds the second vectors to the first vector.
array<double, 3> operator+(const array<double, 3>& a, const array<double, 3>& b);

//! Elementwise subtracts the second vectors from the first vector.
array<double, 3> operator-(const array<double, 3>& a, const array<double, 3>& b);

//! Elementwise adds the second vectors to the first vector.
void operator+=(array<double, 3>& a, const array<double, 3>& b);

//! Multiplies a scalar to a vector.
array<double, 3> operator*(const double s, const array<double, 3>& a);

//! Returns the Euclidean distance between two vectors.
double distance(const array<double, 3>& a, const array<double, 3>& b);

//! Constructs a quaternion by a normalized axis and a rotation angle in degrees.
array<double, 4> vec4_to_qtn4(const array<double, 3>& axis, const double degrees);

//! Returns the quaternion of rotation a followed by rotation b in the frame rotated by a, i.e. the Hamilton product a b.
array<double, 4> compose(const array<double, 4>& a, const array<double, 4>& b);

//! Transforms a quaternion into a 3x3 transformation matrix, e.g. quaternion(1, 0, 0, 0) => identity matrix.
array<double, 9> qtn4_to_mat3(const array<double, 4>& a);

//! Transforms a vector by a 3x3 matrix.
array<double, 3> operator*(const array<double, 9>& m, const array<double, 3>& v);

//! Rotates a vector by a quaternion.
array<double, 3> rotate(const array<double, 4>& q, const array<double, 3>& v);

//! Returns the rotation angle in degrees between two orientations, in [0, 180].
double angle_between(const array<double, 4>& a, const array<double, 4>& b);

#endif
