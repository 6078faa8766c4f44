#include <cmath>
#include <cassert>
#include <algorithm>
#include "array.hpp"

const double pi = 3.14159265358979323846;

//! Converts degrees to radians.
inline double radians(const double degrees)
{
	return degrees * (pi / 180);
}

double norm_sqr(const array<double, 3>& a)
{
	return a[0] * a[0] + a[1] * a[1] + a[2] * a[2];
}

double norm(const array<double, 3>& a)
{
	return sqrt(norm_sqr(a));
}

bool normalized(const array<double, 3>& a)
{
	return fabs(norm_sqr(a) - 1.0) < 1e-6;
}

double norm_sqr(const array<double, 4>& a)
{
	return a[0] * a[0] + a[1] * a[1] + a[2] * a[2] + a[3] * a[3];
}

double norm(const array<double, 4>& a)
{
	return sqrt(norm_sqr(a));
}

bool normalized(const array<double, 4>& a)
{
	return fabs(norm_sqr(a) - 1.0) < 1e-6;
}

array<double, 4> normalize(const array<double, 4>& a)
{
	const double norm_inv = 1.0 / norm(a);
	return
	{
		a[0] * norm_inv,
		a[1] * norm_inv,
		a[2] * norm_inv,
		a[3] * norm_inv,
	};
}

array<double, 3> operator+(const array<double, 3>& a, const array<double, 3>& b)
{
	return
	{
		a[0] + b[0],
		a[1] + b[1],
		a[2] + b[2],
	};
}

array<double, 3> operator-(const array<double, 3>& a, const array<double, 3>& b)
{
	return
	{
		a[0] - b[0],
		a[1] - b[1],
		a[2] - b[2],
	};
}

void operator+=(array<double, 3>& a, const array<double, 3>& b)
{
	a[0] += b[0];
	a[1] += b[1];
	a[2] += b[2];
}

array<double, 3> operator*(const double s, const array<double, 3>& a)
{
	return
	{
		s * a[0],
		s * a[1],
		s * a[2],
	};
}

double distance(const array<double, 3>& a, const array<double, 3>& b)
{
	return norm(a - b);
}

array<double, 4> vec4_to_qtn4(const array<double, 3>& axis, const double degrees)
{
	assert(normalized(axis));
	const double h = radians(degrees) * 0.5;
	const double s = sin(h);
	const double c = cos(h);
	return
	{
		c,
		s * axis[0],
		s * axis[1],
		s * axis[2],
	};
}

array<double, 4> compose(const array<double, 4>& a, const array<double, 4>& b)
{
	assert(normalized(a));
	assert(normalized(b));
	return
	{
		a[0] * b[0] - a[1] * b[1] - a[2] * b[2] - a[3] * b[3],
		a[0] * b[1] + a[1] * b[0] + a[2] * b[3] - a[3] * b[2],
		a[0] * b[2] - a[1] * b[3] + a[2] * b[0] + a[3] * b[1],
		a[0] * b[3] + a[1] * b[2] - a[2] * b[1] + a[3] * b[0],
	};
}

array<double, 9> qtn4_to_mat3(const array<double, 4>& a)
{
	assert(normalized(a));
	const double ww = a[0]*a[0];
	const double wx = a[0]*a[1];
	const double wy = a[0]*a[2];
	const double wz = a[0]*a[3];
	const double xx = a[1]*a[1];
	const double xy = a[1]*a[2];
	const double xz = a[1]*a[3];
	const double yy = a[2]*a[2];
	const double yz = a[2]*a[3];
	const double zz = a[3]*a[3];

	// http://www.boost.org/doc/libs/1_46_1/libs/math/quaternion/TQE.pdf
	// http://en.wikipedia.org/wiki/Quaternions_and_spatial_rotation
	return
	{
		ww+xx-yy-zz, 2*(-wz+xy), 2*(wy+xz),
		2*(wz+xy), ww-xx+yy-zz, 2*(-wx+yz),
		2*(-wy+xz), 2*(wx+yz), ww-xx-yy+zz,
	};
}

array<double, 3> operator*(const array<double, 9>& m, const array<double, 3>& v)
{
	return
	{
		m[0] * v[0] + m[1] * v[1] + m[2] * v[2],
		m[3] * v[0] + m[4] * v[1] + m[5] * v[2],
		m[6] * v[0] + m[7] * v[1] + m[8] * v[2],
	};
}

array<double, 3> rotate(const array<double, 4>& q, const array<double, 3>& v)
{
	return qtn4_to_mat3(q) * v;
}

double angle_between(const array<double, 4>& a, const array<double, 4>& b)
{
	// q and -q describe the same rotation, hence the absolute value.
	const double d = fabs(a[0] * b[0] + a[1] * b[1] + a[2] * b[2] + a[3] * b[3]);
	return 2 * acos(min(d, 1.0)) * (180 / pi);
}
