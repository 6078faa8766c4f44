#include <stdexcept>
#include <boost/test/unit_test.hpp>
#include "rsu.hpp"

BOOST_AUTO_TEST_SUITE(rsu_metric)

BOOST_AUTO_TEST_CASE(closed_regular_rings)
{
	// Three identical RL ligands at theta = 0 close into a triangle when every corner turns by 120 degrees.
	BOOST_CHECK_SMALL(calc_rsu("RLFFRLFFRLFF", 0, 60), 1e-9);
	BOOST_CHECK_SMALL(calc_rsu("RL(FF)RL(FF)RL(FF)", 0, 60), 1e-9);

	// The mirror image needs the joints viewed from the back.
	BOOST_CHECK_SMALL(calc_rsu("LRBBLRBBLRBB", 0, 60), 1e-9);

	// Six RL ligands with delta = 0 close into a hexagon.
	BOOST_CHECK_SMALL(calc_rsu("RLRLRLRLRLRL", 0, 0), 1e-9);
}

BOOST_AUTO_TEST_CASE(open_rings_are_strained)
{
	BOOST_CHECK_GT(calc_rsu("RLFFRLFFRLFF", 0, 87), 0.1);
	BOOST_CHECK_GT(calc_rsu("RLFFRLFFRLFF", 30, 60), 1e-6);
}

BOOST_AUTO_TEST_CASE(non_negative)
{
	for (int theta = 0; theta <= 90; theta += 5)
	{
		BOOST_CHECK_GE(calc_rsu("RRFFLLBBRRFFLLBB", theta, 103), 0);
		BOOST_CHECK_GE(calc_rsu("RL(FF)RL(FF)RL(FF)", theta, 87), 0);
	}
}

BOOST_AUTO_TEST_CASE(reduction_of_metal_positions)
{
	BOOST_CHECK_EQUAL(calc_rsu(vector<array<double, 3>>()), 0);
	vector<array<double, 3>> m;
	m.push_back({ 1, 2, 2 });
	m.push_back({ 3, 0, 4 });
	BOOST_CHECK_SMALL(calc_rsu(m) - 5, 1e-12);
	BOOST_CHECK_SMALL(calc_rsu(calc_metal_positions("RRFFLLBB", 45, 103)) - calc_rsu("RRFFLLBB", 45, 103), 1e-15);
}

BOOST_AUTO_TEST_CASE(invalid_input)
{
	BOOST_CHECK_THROW(calc_rsu("RRFFLLBB", 90.0001, 103), invalid_argument);
	BOOST_CHECK_THROW(calc_rsu("RRFFLLB", 0, 103), invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
