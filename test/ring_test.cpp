#include <cmath>
#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include "ring.hpp"

BOOST_AUTO_TEST_SUITE(ring_walker)

BOOST_AUTO_TEST_CASE(one_metal_per_ligand)
{
	const ring r = walk(conformation("RRFFLLBBRRFFLLBB"), 30, 103);
	BOOST_CHECK_EQUAL(r.metal_positions.size(), 4);
	BOOST_CHECK_EQUAL(r.frags_of_ligs.size(), 4);
	BOOST_CHECK_EQUAL(r.frames.size(), 5);
	BOOST_CHECK(r.frames.front().orientation == qtn4id);
}

BOOST_AUTO_TEST_CASE(syn_t_1_at_theta_0)
{
	const vector<array<double, 3>> m = calc_metal_positions("RL(FF)RL(FF)RL(FF)", 0, 87);
	BOOST_REQUIRE_EQUAL(m.size(), 3);
	for (const auto& p : m)
	{
		for (const double v : p)
		{
			BOOST_CHECK(std::isfinite(v));
		}
	}

	// The first ligand starts at the origin in the absolute system.
	BOOST_CHECK_SMALL(m[0][0] - 1.5, 1e-9);
	BOOST_CHECK_SMALL(m[0][1] - sqrt(3.0) * 0.5, 1e-9);
	BOOST_CHECK_SMALL(m[0][2], 1e-9);

	// Brackets and default bridges make no difference.
	const vector<array<double, 3>> n = calc_metal_positions("RLRLRL", 0, 87);
	BOOST_REQUIRE_EQUAL(n.size(), 3);
	for (size_t i = 0; i < 3; ++i)
	{
		BOOST_CHECK_SMALL(distance(m[i], n[i]), 1e-12);
	}
}

BOOST_AUTO_TEST_CASE(metal_positions_follow_ligand_order)
{
	const conformation c("RRFFLLBBRLFBLRBF");
	const ring r = walk(c, 40, 95);
	BOOST_REQUIRE_EQUAL(r.metal_positions.size(), c.size());
	array<double, 3> previous = {};
	for (size_t i = 0; i < c.size(); ++i)
	{
		// Every ligand spans sqrt(3) from the previous metal center.
		BOOST_CHECK_SMALL(distance(previous, r.metal_positions[i]) - sqrt(3.0), 1e-9);
		BOOST_CHECK_SMALL(distance(r.frames[i].position, previous), 1e-12);
		BOOST_CHECK_SMALL(distance(r.frames[i + 1].position, r.metal_positions[i]), 1e-12);
		previous = r.metal_positions[i];
	}
}

BOOST_AUTO_TEST_CASE(frame_rotates_local_into_absolute)
{
	frame f;
	f.position = {1, 2, 3};
	f.orientation = vec4_to_qtn4({0, 0, 1}, 90);
	const array<double, 3> p = f.to_absolute({1, 0, 0});
	BOOST_CHECK_SMALL(p[0] - 1, 1e-12);
	BOOST_CHECK_SMALL(p[1] - 3, 1e-12);
	BOOST_CHECK_SMALL(p[2] - 3, 1e-12);
}

BOOST_AUTO_TEST_CASE(backbone_fragments)
{
	const ring r = walk(conformation("RRFFLLBB"), 20, 103);
	array<double, 3> a = {};
	for (size_t i = 0; i < r.frags_of_ligs.size(); ++i)
	{
		const vector<fragment>& frags = r.frags_of_ligs[i];
		BOOST_REQUIRE_EQUAL(frags.size(), 2);
		BOOST_REQUIRE_EQUAL(frags[0].size(), 2);
		BOOST_REQUIRE_EQUAL(frags[1].size(), 2);
		BOOST_CHECK_SMALL(distance(frags[0][0], a), 1e-12);
		BOOST_CHECK_SMALL(distance(frags[0][1], frags[1][0]), 1e-12);
		BOOST_CHECK_SMALL(distance(frags[1][1], r.metal_positions[i]), 1e-12);
		BOOST_CHECK_SMALL(distance(frags[0][0], frags[0][1]) - 1, 1e-9);
		BOOST_CHECK_SMALL(distance(frags[1][0], frags[1][1]) - 1, 1e-9);
		a = r.metal_positions[i];
	}
	BOOST_CHECK_EQUAL(calc_carbon_positions("RRFFLLBB", 20, 103).size(), 2);
}

BOOST_AUTO_TEST_CASE(regular_hexagon)
{
	// RL at theta = 0 turns by 60 degrees in the plane, and so does a front face bridge with delta = 0.
	const ring r = walk(conformation("RLRLRLRLRLRL"), 0, 0);
	BOOST_REQUIRE_EQUAL(r.metal_positions.size(), 6);
	for (const auto& p : r.metal_positions)
	{
		BOOST_CHECK_SMALL(p[2], 1e-9);
	}
	BOOST_CHECK_SMALL(norm(r.metal_positions.back()), 1e-9);
	BOOST_CHECK_SMALL(angle_between(r.frames.back().orientation, qtn4id), 1e-3);
}

BOOST_AUTO_TEST_CASE(open_chain_is_returned)
{
	// A zigzag never comes back to the origin.
	const ring r = walk(conformation("RRFFRRFFRRFFRRFF"), 0, 30);
	BOOST_CHECK_EQUAL(r.metal_positions.size(), 4);
	BOOST_CHECK_GT(norm(r.metal_positions.back()), 1);
}

BOOST_AUTO_TEST_CASE(invalid_input)
{
	BOOST_CHECK_THROW(walk(conformation("RLRL"), 90.0001, 87), invalid_argument);
	BOOST_CHECK_THROW(calc_metal_positions("RLRL", -0.0001, 87), invalid_argument);
	BOOST_CHECK_THROW(calc_metal_positions("RLR", 0, 87), invalid_argument);
	BOOST_CHECK_THROW(calc_carbon_positions("RLQQ", 0, 87), invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
