// mover.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <set>
#include <map>
#include <algorithm>

#include "defs.h"

namespace mover
{
	bool isImage(const std::fs::path& path)
	{
		static const std::set<std::string> exts = {
			".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"
		};

		return exts.count(util::lowercase(path.extension().string())) > 0;
	}

	static bool isHidden(const std::fs::path& p)
	{
		auto name = p.filename().string();
		return !name.empty() && name[0] == '.';
	}

	std::vector<std::fs::path> collectFiles(const std::fs::path& source, bool imagesOnly, int maxDepth,
		bool skipHidden)
	{
		std::vector<std::fs::path> ret;

		std::error_code ec;
		auto it = std::fs::recursive_directory_iterator(source, std::fs::directory_options::skip_permission_denied, ec);
		if(ec)
			return ret;

		for(auto end = std::fs::recursive_directory_iterator(); it != end; it.increment(ec))
		{
			if(ec)
			{
				util::warn("error while listing '%s': %s", source.string(), ec.message());
				break;
			}

			const auto& entry = *it;

			// depth() is 0 for things directly inside 'source'.
			bool isDir = entry.is_directory(ec) && !entry.is_symlink(ec);
			if(isDir && ((skipHidden && isHidden(entry.path())) || (maxDepth > 0 && it.depth() + 1 >= maxDepth)))
			{
				it.disable_recursion_pending();
				continue;
			}

			if(skipHidden && isHidden(entry.path()))
				continue;

			if(entry.is_symlink(ec) || !entry.is_regular_file(ec))
				continue;

			if(imagesOnly && !isImage(entry.path()))
				continue;

			ret.push_back(entry.path());
		}

		std::sort(ret.begin(), ret.end());
		return ret;
	}

	// true if 'dir' is (or, in a dry run, would be) empty once everything in 'gone' has left.
	static bool prune(const std::fs::path& dir, int depth, int maxDepth, const std::set<std::fs::path>& gone,
		const config::Options& opts, std::vector<std::fs::path>& removed)
	{
		std::error_code ec;

		std::vector<std::fs::path> children;
		for(auto it = std::fs::directory_iterator(dir, ec); !ec && it != std::fs::directory_iterator(); it.increment(ec))
			children.push_back(it->path());

		if(ec)
			return false;

		bool empty = true;
		for(const auto& c : children)
		{
			if(opts.skipHidden && isHidden(c))
			{
				empty = false;
			}
			else if(std::fs::is_directory(std::fs::symlink_status(c, ec)))
			{
				if(maxDepth > 0 && depth + 1 > maxDepth)
					empty = false;

				else if(!prune(c, depth + 1, maxDepth, gone, opts, removed))
					empty = false;
			}
			else if(gone.count(c) == 0)
			{
				empty = false;
			}
		}

		// the source folder itself stays.
		if(!empty || depth == 0)
			return empty;

		if(!opts.dryRun)
		{
			std::fs::remove(dir, ec);
			if(ec)
			{
				util::warn("could not remove '%s': %s", dir.string(), ec.message());
				return false;
			}
		}

		removed.push_back(dir);
		return true;
	}

	// rename(2) can't cross filesystems, so fall back to copying.
	static std::error_code moveOne(const std::fs::path& from, const std::fs::path& to)
	{
		std::error_code ec;
		std::fs::rename(from, to, ec);
		if(ec != std::errc::cross_device_link)
			return ec;

		ec.clear();
		std::fs::copy_file(from, to, std::fs::copy_options::none, ec);
		if(ec)
			return ec;

		std::fs::remove(from, ec);
		if(ec)
		{
			// don't leave two copies behind.
			std::error_code ec2;
			std::fs::remove(to, ec2);
		}

		return ec;
	}

	Outcome moveFiles(const std::fs::path& source, const std::fs::path& dest, Kind kind, const config::Options& opts,
		const ProgressFn& progress)
	{
		Outcome outcome;
		outcome.dryRun = opts.dryRun;

		auto fail = [&outcome](ErrorKind error, const std::string& msg) -> Outcome {
			outcome.fatal = error;
			outcome.message = msg;
			return outcome;
		};

		std::error_code ec;
		if(!std::fs::is_directory(source, ec))
			return fail(ErrorKind::InaccessibleRoot, zpr::sprint("'%s' is not an accessible directory", source.string()));

		auto probe = std::fs::directory_iterator(source, ec);
		if(ec)
			return fail(ErrorKind::InaccessibleRoot, zpr::sprint("cannot read '%s': %s", source.string(), ec.message()));

		auto src = std::fs::weakly_canonical(source, ec);
		if(ec)
			return fail(ErrorKind::InaccessibleRoot, zpr::sprint("cannot resolve '%s': %s", source.string(), ec.message()));

		auto dst = std::fs::weakly_canonical(dest, ec);
		if(ec)
			return fail(ErrorKind::InvalidTargetName, zpr::sprint("cannot resolve '%s': %s", dest.string(), ec.message()));

		if(util::isWithin(dst, src))
		{
			return fail(ErrorKind::InvalidTargetName, zpr::sprint("destination '%s' is inside '%s'", dest.string(),
				source.string()));
		}

		if(std::fs::exists(std::fs::symlink_status(dst, ec)) && !std::fs::is_directory(dst, ec))
			return fail(ErrorKind::InvalidTargetName, zpr::sprint("'%s' exists and is not a directory", dest.string()));

		if(!opts.dryRun)
		{
			std::fs::create_directories(dst, ec);
			if(ec)
			{
				return fail(ErrorKind::InaccessibleRoot, zpr::sprint("could not create '%s': %s", dest.string(),
					ec.message()));
			}
		}

		bool photos = (kind == Kind::Photos);
		int maxDepth = photos ? 0 : MOVE_DEPTH;

		auto files = collectFiles(src, /* imagesOnly: */ photos, maxDepth, opts.skipHidden);
		outcome.totalCandidates = files.size();


		// the destination is flat, so two files with the same name can't both go there.
		std::map<std::string, std::vector<size_t>> names;
		for(size_t i = 0; i < files.size(); i++)
		{
			FileResult res;
			res.original = files[i];
			res.target = dst / files[i].filename();

			names[files[i].filename().string()].push_back(i);
			outcome.files.push_back(res);
		}

		std::vector<bool> pending(files.size(), true);
		for(const auto& [ name, idxs ] : names)
		{
			for(auto i : idxs)
			{
				auto& res = outcome.files[i];
				if(idxs.size() > 1)
					res.message = zpr::sprint("%d files are named '%s'", idxs.size(), name);

				else if(std::fs::exists(std::fs::symlink_status(res.target, ec)))
					res.message = zpr::sprint("'%s' already exists in the destination", name);

				else
					continue;

				res.status = Status::Failed;
				res.error = ErrorKind::NameCollision;
				pending[i] = false;
			}
		}


		std::set<std::fs::path> gone;
		for(size_t i = 0; i < files.size(); i++)
		{
			auto& res = outcome.files[i];
			if(pending[i])
			{
				if(opts.dryRun)
				{
					res.status = Status::WouldMove;
				}
				else if(std::fs::exists(std::fs::symlink_status(res.target, ec)))
				{
					res.status = Status::Failed;
					res.error = ErrorKind::NameCollision;
					res.message = zpr::sprint("'%s' already exists in the destination", res.target.filename().string());
				}
				else if(auto err = moveOne(res.original, res.target); err)
				{
					res.status = Status::Failed;
					res.error = ErrorKind::RenameFailed;
					res.message = err.message();
				}
				else
				{
					res.status = Status::Moved;
				}
			}

			if(res.status == Status::Moved || res.status == Status::WouldMove)
			{
				outcome.movedCount += 1;
				gone.insert(res.original);
			}
			else
			{
				outcome.errorCount += 1;
			}

			if(progress)
			{
				auto pct = (static_cast<double>(i + 1) * 100.0) / static_cast<double>(files.size());
				progress(pct, zpr::sprint("moving %d of %d", i + 1, files.size()));
			}
		}

		if(files.empty() && progress)
			progress(100.0, "no files");

		prune(src, 0, maxDepth, gone, opts, outcome.removedFolders);
		return outcome;
	}
}
