#pragma once
#ifndef RSUANALYZER_IO_SERVICE_POOL_HPP
#define RSUANALYZER_IO_SERVICE_POOL_HPP

#include <vector>
#include <memory>
#include <future>
#include <boost/asio/io_service.hpp>
using namespace std;
using namespace boost::asio;

//! Represents a pool of worker threads running the handlers posted to an io service.
class io_service_pool : public io_service, public vector<future<void>>
{
public:
	//! Creates concurrency worker threads, all of which keep running until wait() is called.
	explicit io_service_pool(const unsigned concurrency);

	//! Lets the worker threads exit once all the posted handlers are done, and joins them.
	void wait();
private:
	unique_ptr<work> w;
};

#endif
