#include <iostream>
#include <iomanip>
#include <boost/program_options.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include "ring.hpp"
#include "plot.hpp"
using namespace boost::filesystem;

int main(int argc, char* argv[])
{
	string conf_id;
	double theta, delta, margin;
	path output_path;

	try
	{
		using namespace boost::program_options;
		options_description all_options("chain2csv exports the metal and carbon positions of a ring for plotting");
		all_options.add_options()
			("conformation", value<string>(&conf_id)->required(), "conformation ID of the ring, e.g. RL(FF)RL(FF)RL(FF)")
			("theta", value<double>(&theta)->required(), "tilting angle in degrees within [0, 90]")
			("delta", value<double>(&delta)->required(), "bridge angle at the metal centers in degrees")
			("output", value<path>(&output_path)->default_value("chain.csv"), "output CSV file of kind,ligand,fragment,x,y,z")
			("margin", value<double>(&margin)->default_value(3), "margin of the axis limits")
			("help", "help information")
			;
		variables_map vm;
		store(parse_command_line(argc, argv, all_options), vm);
		if (argc == 1 || vm.count("help"))
		{
			cout << all_options;
			return 0;
		}
		vm.notify();
		if (is_directory(output_path))
		{
			cerr << "Option output " << output_path << " is a directory" << endl;
			return 1;
		}
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}

	try
	{
		const ring r = walk(conformation(conf_id), theta, delta);

		boost::filesystem::ofstream ofs;
		ofs.exceptions(ios::failbit | ios::badbit);
		ofs.open(output_path);
		ofs << "kind,ligand,fragment,x,y,z\n" << setprecision(12);

		// Metal centers are numbered from 1. The fragment column is left empty for them.
		vector<array<double, 3>> points(r.metal_positions);
		for (size_t i = 0; i < r.metal_positions.size(); ++i)
		{
			const array<double, 3>& p = r.metal_positions[i];
			ofs << "metal," << i + 1 << ",," << p[0] << ',' << p[1] << ',' << p[2] << '\n';
		}
		for (size_t i = 0; i < r.frags_of_ligs.size(); ++i)
		{
			for (size_t j = 0; j < r.frags_of_ligs[i].size(); ++j)
			{
				for (const auto& p : r.frags_of_ligs[i][j])
				{
					ofs << "carbon," << i + 1 << ',' << j + 1 << ',' << p[0] << ',' << p[1] << ',' << p[2] << '\n';
					points.push_back(p);
				}
			}
		}
		cout << "Wrote " << r.metal_positions.size() << " metal centers and " << r.frags_of_ligs.size() << " ligands to " << output_path << endl;

		// Report cubic axis limits for a 1:1:1 view.
		const axis_limits l = limit_axis(points, margin);
		const array<char, 3> c = { 'x', 'y', 'z' };
		cout.setf(ios::fixed, ios::floatfield);
		cout << setprecision(3);
		for (size_t i = 0; i < 3; ++i)
		{
			cout << c[i] << "lim=" << l.lower[i] << ',' << l.upper[i] << endl;
		}
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}
}
