// process.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <chrono>
#include <thread>
#include <algorithm>

#include "tinyprocesslib/tinyprocess.h"

namespace proc
{
	static void removeAll(const std::vector<std::fs::path>& paths)
	{
		for(const auto& p : paths)
		{
			std::error_code ec;
			if(std::fs::exists(std::fs::symlink_status(p, ec)))
			{
				std::fs::remove_all(p, ec);
				if(ec) util::warn("could not remove '%s': %s", p.string(), ec.message());
			}
		}
	}

	Result run(const std::string& cmdline)
	{
		Result result;

		tinyproclib::Process proc(cmdline, "", [&result](const char* bytes, size_t n) {
			result.out += std::string(bytes, n);
		}, [&result](const char* bytes, size_t n) {
			result.err += std::string(bytes, n);
		});

		// note: this waits for the process to finish.
		result.status = proc.get_exit_status();

		if(result.status != 0)
			result.error = ErrorKind::ToolFailed;

		return result;
	}

	Result supervise(const Job& job, const config::Options& opts, CancelToken& cancel, const ProgressFn& progress)
	{
		Result result;
		defer(removeAll(job.tempFiles));

		if(cancel.isCancelled())
		{
			result.error = ErrorKind::Cancelled;
			return result;
		}

		tinyproclib::Process proc(job.cmdline, "", [&result](const char* bytes, size_t n) {
			result.out += std::string(bytes, n);
		}, [&result](const char* bytes, size_t n) {
			result.err += std::string(bytes, n);
		});

		if(proc.get_id() <= 0)
		{
			result.error = ErrorKind::ToolFailed;
			result.err = zpr::sprint("could not start '%s'", job.cmdline);
			return result;
		}

		// sleep in small slices so a cancel doesn't have to wait out a whole interval.
		constexpr auto slice = std::chrono::milliseconds(50);
		auto interval = std::chrono::milliseconds(std::max(opts.pollIntervalMs, 1));

		int status = 0;
		while(!proc.try_get_exit_status(status))
		{
			if(cancel.isCancelled())
			{
				proc.kill();
				proc.get_exit_status();

				removeAll(job.partialOutputs);

				result.error = ErrorKind::Cancelled;
				return result;
			}

			if(job.poll && progress)
			{
				auto [ pct, msg ] = job.poll();
				progress(pct, msg);
			}

			auto start = std::chrono::steady_clock::now();
			while(std::chrono::steady_clock::now() - start < interval && !cancel.isCancelled())
			{
				if(proc.try_get_exit_status(status))
					goto done;

				std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(slice, interval));
			}
		}

	done:
		result.status = status;
		if(status != 0)
		{
			removeAll(job.partialOutputs);
			result.error = ErrorKind::ToolFailed;
		}

		return result;
	}

	bool checkDependencies(const std::vector<std::string>& programs)
	{
		bool ok = true;
		for(const auto& p : programs)
		{
			if(util::findProgram(p).empty())
			{
				util::error("%s: '%s' (install it and try again)", errorKindName(ErrorKind::MissingDependency), p);
				ok = false;
			}
		}

		return ok;
	}
}
