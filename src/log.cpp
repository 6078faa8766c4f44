#include <iomanip>
#include <boost/filesystem/fstream.hpp>
#include "log.hpp"

void log_engine::write(const path& log_path) const
{
	boost::filesystem::ofstream log;
	log.exceptions(ios::failbit | ios::badbit);
	log.open(log_path);
	log << "theta,rsu\n" << setprecision(12);
	for (const auto& r : *this)
	{
		log << r.theta << ',' << r.rsu << '\n';
	}
}
