// video.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <thread>
#include <algorithm>
#include <unistd.h>

#include "defs.h"

namespace video
{
	static constexpr const char* FFMPEG_PROGRAM     = "ffmpeg";
	static constexpr const char* MEDIAINFO_PROGRAM  = "mediainfo";

	std::optional<Quality> parseQuality(const std::string& name)
	{
		auto x = util::lowercase(util::trim(name));

		if(x == "high")     return Quality { "veryfast", 18 };
		if(x == "medium")   return Quality { "veryfast", 23 };
		if(x == "low")      return Quality { "veryfast", 28 };

		return std::nullopt;
	}

	std::fs::path outputPath(const std::fs::path& input)
	{
		return input.parent_path() / (input.stem().string() + "_processed" + input.extension().string());
	}

	std::string buildCompressCommand(const std::fs::path& input, const std::fs::path& output,
		const Quality& quality, const std::fs::path& progressFile, int threads)
	{
		return zpr::sprint("nice -n 10 %s -nostdin -i %s -c:v libx264 -preset %s -crf %d -c:a aac -b:a 128k"
			" -threads %d -progress %s -n %s", FFMPEG_PROGRAM, util::shellQuote(input.string()), quality.preset,
			quality.crf, threads, util::shellQuote(progressFile.string()), util::shellQuote(output.string()));
	}

	std::string buildSubtitleCommand(const std::fs::path& input, const std::fs::path& subtitle,
		const std::fs::path& output, const std::fs::path& progressFile)
	{
		// mp4 can only carry mov_text subtitles.
		auto codec = util::lowercase(output.extension().string()) == ".mp4" ? "mov_text" : "srt";

		return zpr::sprint("nice -n 10 %s -nostdin -i %s -i %s -map 0:v -map 0:a -map 1 -c:v copy -c:a copy -c:s %s"
			" -progress %s -n %s", FFMPEG_PROGRAM, util::shellQuote(input.string()), util::shellQuote(subtitle.string()),
			codec, util::shellQuote(progressFile.string()), util::shellQuote(output.string()));
	}

	static bool parse_number(const std::string& s, double& out)
	{
		auto t = util::trim(s);
		if(t.empty())
			return false;

		char* end = nullptr;
		out = strtod(t.c_str(), &end);

		return end && *end == 0;
	}

	// HH:MM:SS(.frac)
	static bool parse_clock(const std::string& s, double& out)
	{
		auto parts = util::splitString(util::trim(s), ':');
		if(parts.size() != 3)
			return false;

		double h = 0, m = 0, sec = 0;
		if(!parse_number(parts[0], h) || !parse_number(parts[1], m) || !parse_number(parts[2], sec))
			return false;

		out = h * 3600 + m * 60 + sec;
		return true;
	}

	double parseProgressSeconds(const std::string& text)
	{
		double latest = -1;

		for(auto line : util::splitString(text))
		{
			line = util::trim(line);

			double x = 0;

			// out_time_ms is actually in microseconds as well; ffmpeg has had that bug forever.
			if(line.find("out_time_us=") == 0 || line.find("out_time_ms=") == 0)
			{
				if(parse_number(line.substr(strlen("out_time_us=")), x) && x >= 0)
					latest = x / 1000000.0;
			}
			else if(line.find("out_time=") == 0)
			{
				if(parse_clock(line.substr(strlen("out_time=")), x) && x >= 0)
					latest = x;
			}
			else if(auto i = line.find("time="); i != std::string::npos && (i == 0 || line[i - 1] == ' '))
			{
				// the stats line on stderr: "frame=  100 fps= 25 ... time=00:00:04.00 bitrate=..."
				auto rest = line.substr(i + 5);
				if(parse_clock(rest.substr(0, rest.find(' ')), x) && x >= 0)
					latest = x;
			}
		}

		return latest;
	}

	double parseDurationMs(const std::string& text)
	{
		auto lines = util::splitString(util::trim(text));
		if(lines.empty())
			return -1;

		double x = 0;
		if(!parse_number(lines[0], x) || x < 0)
			return -1;

		return x;
	}

	double estimatePercent(double elapsed, double duration)
	{
		if(duration <= 0 || elapsed < 0)
			return -1;

		// 100 is saved for when ffmpeg actually exits.
		return std::min(99.0, static_cast<double>(static_cast<int>(elapsed * 100.0 / duration)));
	}

	static double probeDuration(const std::fs::path& input)
	{
		if(util::findProgram(MEDIAINFO_PROGRAM).empty())
		{
			util::warn("'%s' not found; progress will not be estimated", MEDIAINFO_PROGRAM);
			return -1;
		}

		auto res = proc::run(zpr::sprint("%s %s %s", MEDIAINFO_PROGRAM, util::shellQuote("--Inform=General;%Duration%"),
			util::shellQuote(input.string())));

		if(!res.ok())
			return -1;

		auto ms = parseDurationMs(res.out);
		return ms < 0 ? -1 : ms / 1000.0;
	}

	bool processVideo(const std::fs::path& input, Operation op, const std::string& argument,
		const config::Options& opts, proc::CancelToken& cancel, const ProgressFn& progress)
	{
		{
			std::error_code ec;
			if(!std::fs::is_regular_file(input, ec))
			{
				util::error("'%s' is not a file", input.string());
				return false;
			}
		}

		if(!proc::checkDependencies({ FFMPEG_PROGRAM }))
			return false;

		auto output = outputPath(input);
		auto progressFile = std::fs::temp_directory_path() / zpr::sprint("renaminator-progress-%d.txt", getpid());

		std::string cmdline;
		std::string what;
		if(op == Operation::Compress)
		{
			auto quality = parseQuality(argument.empty() ? "medium" : argument);
			if(!quality.has_value())
			{
				util::error("unknown quality '%s' (expected 'high', 'medium' or 'low')", argument);
				return false;
			}

			auto threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency() / 2));

			cmdline = buildCompressCommand(input, output, *quality, progressFile, threads);
			what = "compress";
		}
		else
		{
			std::error_code ec;
			if(!std::fs::is_regular_file(argument, ec))
			{
				util::error("subtitle file '%s' does not exist", argument);
				return false;
			}

			cmdline = buildSubtitleCommand(input, argument, output, progressFile);
			what = "subtitles";
		}

		// never overwrite an existing output, or delete it when the run fails.
		if(std::error_code ec; std::fs::exists(std::fs::symlink_status(output, ec)))
		{
			util::error("'%s' already exists; not overwriting it", output.filename().string());
			return false;
		}

		if(opts.dryRun)
		{
			util::log("dryrun: cmdline would have been:");
			util::info("%s", cmdline);
			return true;
		}

		auto duration = probeDuration(input);

		proc::Job job;
		job.cmdline = cmdline;
		job.partialOutputs = { output };
		job.tempFiles = { progressFile };

		job.poll = [progressFile, duration]() -> std::pair<double, std::string> {

			// ffmpeg doesn't create it until it has something to say.
			std::string text;
			if(std::error_code ec; std::fs::exists(progressFile, ec))
			{
				if(auto [ buf, sz ] = util::readEntireFile(progressFile.string()); buf)
				{
					text = std::string(reinterpret_cast<char*>(buf), sz);
					delete[] buf;
				}
			}

			auto elapsed = parseProgressSeconds(text);
			if(elapsed < 0)
				return { -1, "starting..." };

			auto ns = [](double secs) -> uint64_t { return static_cast<uint64_t>(secs * 1000 * 1000 * 1000); };

			auto pct = estimatePercent(elapsed, duration);
			if(pct < 0)
				return { -1, zpr::sprint("processing: %s", util::uglyPrintTime(ns(elapsed), false)) };

			return { pct, zpr::sprint("processing: %s / %s", util::uglyPrintTime(ns(elapsed), false),
				util::uglyPrintTime(ns(duration), false)) };
		};

		// a stale progress file from a previous run would make the first poll lie.
		{
			std::error_code ec;
			std::fs::remove(progressFile, ec);
		}

		if(progress)
			progress(0, "starting...");

		auto res = proc::supervise(job, opts, cancel, progress);
		if(res.error == ErrorKind::Cancelled)
		{
			util::warn("cancelled; removed partial output");
			return false;
		}
		else if(!res.ok())
		{
			util::error("%s returned non-zero (status = %d)", FFMPEG_PROGRAM, res.status);
			util::error("cmdline was: %s", cmdline);

			if(!res.err.empty())
			{
				// ffmpeg is chatty; the last few lines are the ones that matter.
				auto lines = util::splitString(res.err);
				for(size_t i = lines.size() > 5 ? lines.size() - 5 : 0; i < lines.size(); i++)
					util::error("%s", lines[i]);
			}

			return false;
		}

		if(progress)
			progress(100, "complete");

		util::info("output: %s", output.filename().string());
		util::logOperation(opts.operationLog, zpr::sprint("Processed video: %s (%s)", input.string(), what));

		return true;
	}
}
