#include <iostream>
#include <thread>
#include <boost/program_options.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include "ligand.hpp"
#include "sweep.hpp"

int main(int argc, char* argv[])
{
	string conf_id;
	path output_folder_path, output_filename;
	double delta, theta_begin, theta_end, theta_step;
	size_t num_threads;
	vector<double> thetas;

	// Process program options.
	try
	{
		// Initialize the default values of optional arguments.
		const path default_output_folder_path = "output";
		const path default_output_filename = "rsu.csv";
		const double default_theta_begin = 0;
		const double default_theta_end = 90;
		const double default_theta_step = 1;
		const size_t default_num_threads = thread::hardware_concurrency();

		// Set up options description.
		using namespace boost::program_options;
		options_description input_options("input (required)");
		input_options.add_options()
			("conformation", value<string>(&conf_id)->required(), "conformation ID of the ring, e.g. RRFFLLBBRRFFLLBB or RL(FF)RL(FF)RL(FF)")
			("delta", value<double>(&delta)->required(), "bridge angle at the metal centers in degrees")
			;
		options_description output_options("output (optional)");
		output_options.add_options()
			("output_folder", value<path>(&output_folder_path)->default_value(default_output_folder_path), "folder of the output CSV file")
			("output", value<path>(&output_filename)->default_value(default_output_filename), "filename of the output CSV file of theta,rsu")
			;
		options_description miscellaneous_options("options (optional)");
		miscellaneous_options.add_options()
			("theta_begin", value<double>(&theta_begin)->default_value(default_theta_begin), "first tilting angle in degrees")
			("theta_end", value<double>(&theta_end)->default_value(default_theta_end), "last tilting angle in degrees")
			("theta_step", value<double>(&theta_step)->default_value(default_theta_step), "increment of tilting angle in degrees")
			("threads", value<size_t>(&num_threads)->default_value(default_num_threads), "number of worker threads to use")
			("help", "help information")
			("version", "version information")
			("config", value<path>(), "options can be loaded from a configuration file")
			;
		options_description all_options;
		all_options.add(input_options).add(output_options).add(miscellaneous_options);

		// Parse command line arguments.
		variables_map vm;
		store(parse_command_line(argc, argv, all_options), vm);

		// If no command line argument is supplied or help is requested, print the usage and exit.
		if (argc == 1 || vm.count("help"))
		{
			cout << all_options;
			return 0;
		}

		// If version is requested, print the version and exit.
		if (vm.count("version"))
		{
			cout << "1.0" << endl;
			return 0;
		}

		// If a configuration file is presented, parse it.
		if (vm.count("config"))
		{
			boost::filesystem::ifstream config_file(vm["config"].as<path>());
			store(parse_config_file(config_file, all_options), vm);
		}

		// Notify the user of parsing errors, if any.
		vm.notify();

		// Validate the theta range.
		if (!valid_theta(theta_begin) || !valid_theta(theta_end))
		{
			cerr << "Option theta_begin and theta_end must be within [0, 90]" << endl;
			return 1;
		}
		if (theta_end < theta_begin)
		{
			cerr << "Option theta_end must not be less than theta_begin" << endl;
			return 1;
		}
		if (theta_step <= 0)
		{
			cerr << "Option theta_step must be positive" << endl;
			return 1;
		}
		thetas = theta_range(theta_begin, theta_end, theta_step);

		// Validate output_folder.
		if (exists(output_folder_path))
		{
			if (!is_directory(output_folder_path))
			{
				cerr << "Output folder " << output_folder_path << " is not a directory" << endl;
				return 1;
			}
		}
		else
		{
			if (!create_directories(output_folder_path))
			{
				cerr << "Failed to create output folder " << output_folder_path << endl;
				return 1;
			}
		}

		// Validate output.
		if (is_directory(output_folder_path / output_filename))
		{
			cerr << "Option output " << output_folder_path / output_filename << " is a directory" << endl;
			return 1;
		}

		// Validate miscellaneous options.
		if (!num_threads)
		{
			cerr << "Option threads must be 1 or greater" << endl;
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
		// Initialize an io service pool and create worker threads.
		cout << "Creating an io service pool of " << num_threads << " worker thread" << (num_threads == 1 ? "" : "s") << endl;
		io_service_pool io(num_threads);

		// Calculate the RSU at every theta in parallel.
		cout << "Calculating RSU of " << conf_id << " with delta=" << delta << " at " << thetas.size() << " theta" << (thetas.size() == 1 ? "" : "s") << endl;
		const log_engine log = sweep(io, conf_id, thetas, delta);

		// Write the records to the CSV file.
		const path output_path = output_folder_path / output_filename;
		cout << "Writing " << log.size() << " records to " << output_path << endl;
		log.write(output_path);
	}
	catch (const exception& e)
	{
		cerr << e.what() << endl;
		return 1;
	}
}
