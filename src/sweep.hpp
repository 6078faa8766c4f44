#pragma once
#ifndef RSUANALYZER_SWEEP_HPP
#define RSUANALYZER_SWEEP_HPP

#include <string>
#include "io_service_pool.hpp"
#include "log.hpp"

//! Returns begin, begin + step, ..., up to and including end. Throws invalid_argument if step is not positive or end < begin.
vector<double> theta_range(const double theta_begin, const double theta_end, const double theta_step);

//! Calculates the RSU of a ring at every theta on the worker threads of an io service pool and returns the records in the order of thetas.
//! The pool is drained and joined before returning, so it serves one sweep only.
//! Throws invalid_argument on a malformed conformation ID or any theta outside [0, 90], before any task is posted.
log_engine sweep(io_service_pool& io, const string& conf_id, const vector<double>& thetas, const double delta);

#endif
