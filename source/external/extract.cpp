// extract.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>
#include <chrono>

#include "defs.h"

namespace extract
{
	static bool ends_with(const std::string& s, const std::string& suffix)
	{
		return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
	}

	// { suffix, kind }; longer suffixes first, so '.tar.gz' wins over anything shorter.
	static const std::vector<std::pair<std::string, ArchiveKind>> suffixes = {
		{ ".tar.bz2",   ArchiveKind::TarBz2 },
		{ ".tar.gz",    ArchiveKind::TarGz },
		{ ".tar.xz",    ArchiveKind::TarXz },
		{ ".tbz2",      ArchiveKind::TarBz2 },
		{ ".tgz",       ArchiveKind::TarGz },
		{ ".txz",       ArchiveKind::TarXz },
		{ ".zip",       ArchiveKind::Zip },
		{ ".rar",       ArchiveKind::Rar },
		{ ".7z",        ArchiveKind::SevenZip },
	};

	// split rar volumes: foo.r00, foo.r01, ...
	static const std::regex rarVolume = std::regex("\\.r[0-9][0-9]$");

	ArchiveKind detectArchive(const std::fs::path& path)
	{
		auto name = util::lowercase(path.filename().string());

		for(const auto& [ sfx, kind ] : suffixes)
		{
			if(ends_with(name, sfx) && name.size() > sfx.size())
				return kind;
		}

		if(std::regex_search(name, rarVolume))
			return ArchiveKind::Rar;

		return ArchiveKind::None;
	}

	std::string archiveStem(const std::fs::path& path)
	{
		auto name = path.filename().string();
		auto lower = util::lowercase(name);

		for(const auto& [ sfx, kind ] : suffixes)
		{
			if(ends_with(lower, sfx) && lower.size() > sfx.size())
				return name.substr(0, name.size() - sfx.size());
		}

		if(std::regex_search(lower, rarVolume))
			return name.substr(0, name.size() - 4);

		return path.stem().string();
	}

	const char* requiredProgram(ArchiveKind kind)
	{
		switch(kind)
		{
			case ArchiveKind::Rar:      return "unrar";
			case ArchiveKind::Zip:      return "unzip";
			case ArchiveKind::SevenZip: return "7z";
			case ArchiveKind::TarGz:    return "tar";
			case ArchiveKind::TarBz2:   return "tar";
			case ArchiveKind::TarXz:    return "tar";
			case ArchiveKind::None:     return "";
		}

		return "";
	}

	// none of these overwrite files that already exist in the destination.
	std::string buildCommand(ArchiveKind kind, const std::fs::path& archive, const std::fs::path& dest)
	{
		auto a = util::shellQuote(archive.string());
		auto d = util::shellQuote(dest.string());

		switch(kind)
		{
			case ArchiveKind::Rar:      return zpr::sprint("unrar x -o- %s %s", a, util::shellQuote(dest.string() + "/"));
			case ArchiveKind::Zip:      return zpr::sprint("unzip -n -q %s -d %s", a, d);
			case ArchiveKind::SevenZip: return zpr::sprint("7z x -aos %s %s", a, util::shellQuote("-o" + dest.string()));
			case ArchiveKind::TarGz:    return zpr::sprint("tar --skip-old-files -xzf %s -C %s", a, d);
			case ArchiveKind::TarBz2:   return zpr::sprint("tar --skip-old-files -xjf %s -C %s", a, d);
			case ArchiveKind::TarXz:    return zpr::sprint("tar --skip-old-files -xJf %s -C %s", a, d);
			case ArchiveKind::None:     return "";
		}

		return "";
	}

	bool extractArchive(const std::fs::path& archive, const config::Options& opts, proc::CancelToken& cancel,
		const ProgressFn& progress)
	{
		auto kind = detectArchive(archive);
		if(kind == ArchiveKind::None)
		{
			util::error("unsupported archive format: '%s'", archive.filename().string());
			return false;
		}

		if(!proc::checkDependencies({ requiredProgram(kind) }))
			return false;

		auto dest = archive.parent_path();
		if(dest.empty())
			dest = ".";

		if(opts.createSubfolder)
			dest = dest / archiveStem(archive);

		auto cmdline = buildCommand(kind, archive, dest);
		if(opts.dryRun)
		{
			util::log("dryrun: cmdline would have been:");
			util::info("%s", cmdline);

			if(opts.deleteArchivesAfterExtract)
				util::log("dryrun: would delete '%s'", archive.filename().string());

			return true;
		}

		proc::Job job;
		job.cmdline = cmdline;

		if(opts.createSubfolder)
		{
			std::error_code ec;
			if(std::fs::exists(dest, ec) && !std::fs::is_directory(dest, ec))
			{
				util::error("'%s' exists and is not a directory", dest.string());
				return false;
			}

			// only clean up the folder if we're the ones who made it.
			if(std::fs::create_directory(dest, ec))
				job.partialOutputs.push_back(dest);

			if(ec)
			{
				util::error("failed to create '%s': %s", dest.string(), ec.message());
				return false;
			}
		}

		// there's no way to know how far along the extractor is, so just say how long it's been.
		auto start = std::chrono::steady_clock::now();
		auto name = archive.filename().string();

		job.poll = [start, name]() -> std::pair<double, std::string> {
			auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count();
			return { -1, zpr::sprint("extracting %s (%s)", name, util::uglyPrintTime(ns, /* ms: */ false)) };
		};

		if(progress)
			progress(0, zpr::sprint("extracting %s", name));

		auto res = proc::supervise(job, opts, cancel, progress);
		if(res.error == ErrorKind::Cancelled)
		{
			util::warn("extraction of '%s' cancelled", name);
			return false;
		}
		else if(!res.ok())
		{
			util::error("%s returned non-zero (status = %d)", requiredProgram(kind), res.status);
			util::error("cmdline was: %s", cmdline);

			if(!res.out.empty()) util::error("%s", util::trim(res.out));
			if(!res.err.empty()) util::error("%s", util::trim(res.err));

			return false;
		}

		if(progress)
			progress(100, "complete");

		util::logOperation(opts.operationLog, zpr::sprint("Extracted: %s", archive.string()));

		if(opts.deleteArchivesAfterExtract)
		{
			std::error_code ec;
			std::fs::remove(archive, ec);

			if(ec)
			{
				util::error("failed to delete '%s': %s", name, ec.message());
			}
			else
			{
				util::info("deleted archive");
				util::logOperation(opts.operationLog, zpr::sprint("Deleted archive: %s", archive.string()));
			}
		}

		return true;
	}
}
