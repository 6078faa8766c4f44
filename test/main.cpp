#define BOOST_TEST_MODULE rsuanalyzer
#include <boost/test/unit_test.hpp>
