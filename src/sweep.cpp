#include <cmath>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <exception>
#include "rsu.hpp"
#include "sweep.hpp"

vector<double> theta_range(const double theta_begin, const double theta_end, const double theta_step)
{
	if (!(theta_step > 0)) throw invalid_argument("Theta step must be positive");
	if (theta_end < theta_begin) throw invalid_argument("Theta end must not be less than theta begin");

	// Thetas are computed from their index rather than accumulated, so that e.g. 0..90 step 1 hits 90 exactly.
	// Rounding may overshoot theta_end by an ulp, e.g. 0.2 + 899 * 0.1, hence the clamp.
	const size_t n = static_cast<size_t>(floor((theta_end - theta_begin) / theta_step + 1e-9)) + 1;
	vector<double> thetas(n);
	for (size_t i = 0; i < n; ++i)
	{
		thetas[i] = min(theta_begin + i * theta_step, theta_end);
	}
	return thetas;
}

log_engine sweep(io_service_pool& io, const string& conf_id, const vector<double>& thetas, const double delta)
{
	// Validate everything up front so that no task can fail halfway.
	const conformation conf(conf_id);
	for (const double theta : thetas)
	{
		if (!valid_theta(theta))
		{
			ostringstream oss;
			oss << "Invalid theta: " << theta;
			throw invalid_argument(oss.str());
		}
	}

	// Each task writes to its own slot.
	const size_t n = thetas.size();
	vector<double> rsus(n);
	vector<exception_ptr> errors(n);
	for (size_t i = 0; i < n; ++i)
	{
		io.post([&, i]()
		{
			try
			{
				rsus[i] = calc_rsu(walk(conf, thetas[i], delta).metal_positions);
			}
			catch (const exception&)
			{
				errors[i] = current_exception();
			}
		});
	}
	io.wait();

	log_engine log;
	log.reserve(n);
	for (size_t i = 0; i < n; ++i)
	{
		if (errors[i]) rethrow_exception(errors[i]);
		log.push_back(new rsu_record(thetas[i], rsus[i]));
	}
	return log;
}
