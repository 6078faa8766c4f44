#pragma once
#ifndef RSUANALYZER_LOG_HPP
#define RSUANALYZER_LOG_HPP

#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/filesystem/path.hpp>
using namespace std;
using namespace boost::filesystem;

//! Represents the RSU of a ring at a tilting angle.
class rsu_record
{
public:
	const double theta; //!< Tilting angle in degrees.
	const double rsu; //!< RSU of the ring at theta.

	explicit rsu_record(const double theta, const double rsu) : theta(theta), rsu(rsu) {}
};

//! Represents a table of RSU records ordered by theta.
class log_engine : public boost::ptr_vector<rsu_record>
{
public:
	//! Writes the records to a CSV file with header theta,rsu. Throws ios_base::failure if the file cannot be written.
	void write(const path& log_path) const;
};

#endif
