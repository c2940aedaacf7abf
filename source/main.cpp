// main.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <signal.h>

#include "defs.h"

static proc::CancelToken cancelToken;

static void handleInterrupt(int)
{
	cancelToken.cancel();

	// a second ^C kills us the usual way.
	signal(SIGINT, SIG_DFL);
}

int main(int argc, char** argv)
{
	config::readConfig();
	auto inputs = args::parseCmdLineOpts(argc, argv);

	signal(SIGINT, handleInterrupt);
	signal(SIGTERM, handleInterrupt);

	util::info("received %zu %s", inputs.size(), util::plural("input", inputs.size()));

	if(config::isDryRun())
		util::info("dry run: nothing will be modified");

	auto paths = driver::collectInputs(inputs, config::getMode());

	size_t done = 0;
	size_t failed = inputs.size() - paths.size();
	for(size_t i = 0; i < paths.size(); i++)
	{
		if(cancelToken.isCancelled())
		{
			util::warn("interrupted; skipping the remaining %zu %s", paths.size() - i,
				util::plural("input", paths.size() - i));
			break;
		}

		auto ok = driver::processOneInput(paths[i], cancelToken);

		if(ok)  done += 1;
		else    failed += 1;
	}

	util::info("processed %d %s (%d failed)", done, util::plural("input", done), failed);

	return (failed > 0 || cancelToken.isCancelled()) ? 1 : 0;
}








namespace driver
{
	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		util::error(fmt, args...);
		if(config::shouldStopOnError())
		{
			util::error("stopping on first error");
			exit(-1);
		}
	}

	static ProgressFn makeProgress(const config::Options& opts)
	{
		if(!opts.showProgress)
			return nullptr;

		return [](double pct, const std::string& msg) {
			util::printProgress(pct, msg);
		};
	}

	static const char* actionName(restore::Action a)
	{
		switch(a)
		{
			case restore::Action::Present:          return "present";
			case restore::Action::Recreated:        return "recreated";
			case restore::Action::Renamed:          return "renamed";
			case restore::Action::WouldRecreate:    return "would recreate";
			case restore::Action::WouldRename:      return "would rename";
			case restore::Action::Unresolvable:     return "unresolvable";
		}

		return "?";
	}

	static bool doRestore(const std::fs::path& manifest, const config::Options& opts)
	{
		auto res = restore::restore(manifest, opts);
		if(res.fatal != ErrorKind::None)
		{
			error("%s: %s", errorKindName(res.fatal), res.message);
			return false;
		}

		for(const auto& e : res.entries)
		{
			if(e.action == restore::Action::Unresolvable)
			{
				util::error("%s: %s (%s)", e.path, e.message, errorKindName(e.error));
			}
			else if(e.action != restore::Action::Present)
			{
				if(e.currentPath.empty())   util::log("%s: %s", actionName(e.action), e.path);
				else                        util::log("%s: %s -> %s", actionName(e.action), e.currentPath, e.path);
			}
		}

		util::info("restored %d %s, %d unresolved", res.restoredCount, util::plural("entry", res.restoredCount),
			res.unresolvedCount);

		if(!opts.dryRun)
			util::logOperation(opts.operationLog, zpr::sprint("Restored from %s (%d restored, %d unresolved)",
				manifest.string(), res.restoredCount, res.unresolvedCount));

		if(res.unresolvedCount > 0)
		{
			error("%d %s could not be restored", res.unresolvedCount, util::plural("entry", res.unresolvedCount));
			return false;
		}

		return true;
	}

	static std::optional<std::fs::path> doBackup(const std::fs::path& root, const config::Options& opts)
	{
		util::info("recording manifest");

		auto res = backup::createBackup(root, opts);
		for(const auto& u : res.unreadable)
			util::warn("%s: %s", errorKindName(ErrorKind::UnreadableObject), u);

		if(!res.ok())
		{
			util::error("%s: %s", errorKindName(res.error), res.message);
			return std::nullopt;
		}

		util::info("recorded %d %s in '%s'", res.entryCount, util::plural("entry", res.entryCount),
			res.manifestPath.string());

		util::logOperation(opts.operationLog, zpr::sprint("Backup of %s: %s", root.string(), res.manifestPath.string()));
		return res.manifestPath;
	}

	static bool doRename(const std::fs::path& root, const config::Options& opts)
	{
		std::optional<std::fs::path> manifest;
		if(opts.backupEnabled && !opts.dryRun)
		{
			manifest = doBackup(root, opts);
			if(!manifest)
			{
				util::warn("continuing without a backup");
				if(config::shouldStopOnError())
					return false;
			}
		}

		auto res = renamer::applyRules(root, config::getRules(), opts, makeProgress(opts));
		util::finishProgress();

		if(res.fatal != ErrorKind::None)
		{
			error("%s: %s", errorKindName(res.fatal), res.message);
			return false;
		}

		for(const auto& f : res.files)
		{
			auto from = f.original.lexically_relative(root).string();
			if(f.status == renamer::Status::Failed)
			{
				util::error("%s: %s (%s)", from, f.message, errorKindName(f.error));
			}
			else if(f.status == renamer::Status::Renamed || f.status == renamer::Status::WouldRename)
			{
				util::log("%s%s -> %s", f.status == renamer::Status::WouldRename ? "dryrun: " : "", from,
					f.target.filename().string());
			}
		}

		util::info("%s %d of %d %s, %d %s", opts.dryRun ? "would rename" : "renamed", res.renamedCount,
			res.totalCandidates, util::plural("file", res.totalCandidates), res.errorCount,
			util::plural("error", res.errorCount));

		if(!opts.dryRun)
			util::logOperation(opts.operationLog, zpr::sprint("Renamed %d of %d files in %s", res.renamedCount,
				res.totalCandidates, root.string()));

		if(opts.confirmKeep && !opts.dryRun && res.renamedCount > 0)
		{
			if(!manifest)
			{
				util::warn("no manifest was recorded; the changes cannot be undone");
			}
			else if(!misc::confirm("keep changes?", true))
			{
				util::info("restoring original names");
				util::indent_log();
				defer(util::unindent_log());

				return doRestore(*manifest, opts) && res.errorCount == 0;
			}
		}

		if(res.errorCount > 0)
		{
			error("%d %s could not be renamed", res.errorCount, util::plural("file", res.errorCount));
			return false;
		}

		return true;
	}

	static bool doMove(const std::fs::path& source, mover::Kind kind, const config::Options& opts)
	{
		auto dest = std::fs::path(config::getMoveDestination());

		auto res = mover::moveFiles(source, dest, kind, opts, makeProgress(opts));
		util::finishProgress();

		if(res.fatal != ErrorKind::None)
		{
			error("%s: %s", errorKindName(res.fatal), res.message);
			return false;
		}

		// the mover hands back resolved paths.
		std::error_code ec;
		auto root = std::fs::weakly_canonical(source, ec);
		if(ec) root = source;

		for(const auto& f : res.files)
		{
			auto from = f.original.lexically_relative(root).string();
			if(f.status == mover::Status::Failed)
				util::error("%s: %s (%s)", from, f.message, errorKindName(f.error));

			else
				util::log("%s%s", f.status == mover::Status::WouldMove ? "dryrun: " : "", from);
		}

		for(const auto& d : res.removedFolders)
			util::log("%sremoved empty folder %s", opts.dryRun ? "dryrun: " : "", d.lexically_relative(root).string());

		auto what = (kind == mover::Kind::Photos ? "photo" : "file");
		util::info("%s %d of %d %s into '%s', %d %s", opts.dryRun ? "would move" : "moved", res.movedCount,
			res.totalCandidates, util::plural(what, res.totalCandidates), dest.string(), res.errorCount,
			util::plural("error", res.errorCount));

		if(!opts.dryRun)
		{
			if(kind == mover::Kind::Photos)
				util::logOperation(opts.operationLog, zpr::sprint("Moved photos from %s to %s", source.string(),
					dest.string()));

			else
				util::logOperation(opts.operationLog, zpr::sprint("Moved %d files from %s to %s", res.movedCount,
					source.string(), dest.string()));
		}

		if(res.errorCount > 0)
		{
			error("%d %s could not be moved", res.errorCount, util::plural(what, res.errorCount));
			return false;
		}

		return true;
	}

	bool processOneInput(const std::fs::path& input, proc::CancelToken& cancel)
	{
		util::log("%s", input.string());
		util::indent_log();
		defer(util::unindent_log());
		defer(zpr::println(""));

		auto opts = config::current();
		auto progress = makeProgress(opts);

		bool ok = true;
		switch(config::getMode())
		{
			case config::Mode::Rename:
				ok = doRename(input, opts);
				break;

			case config::Mode::Backup:
				ok = doBackup(input, opts).has_value();
				if(!ok) error("backup failed");
				break;

			case config::Mode::Restore:
				ok = doRestore(input, opts);
				break;

			case config::Mode::Extract:
				ok = extract::extractArchive(input, opts, cancel, progress);
				util::finishProgress();
				if(!ok && !cancel.isCancelled()) error("extraction failed");
				break;

			case config::Mode::Compress:
				ok = video::processVideo(input, video::Operation::Compress, config::getVideoQuality(), opts, cancel,
					progress);
				util::finishProgress();
				if(!ok && !cancel.isCancelled()) error("compression failed");
				break;

			case config::Mode::Subtitles:
				ok = video::processVideo(input, video::Operation::Subtitles, config::getSubtitlePath(), opts, cancel,
					progress);
				util::finishProgress();
				if(!ok && !cancel.isCancelled()) error("adding subtitles failed");
				break;

			case config::Mode::Photos:
				ok = doMove(input, mover::Kind::Photos, opts);
				break;

			case config::Mode::Move:
				ok = doMove(input, mover::Kind::AllFiles, opts);
				break;
		}

		return ok;
	}

	std::vector<std::fs::path> collectInputs(const std::vector<std::string>& inputs, config::Mode mode)
	{
		std::vector<std::fs::path> ret;

		for(const auto& input : inputs)
		{
			auto path = std::fs::path(input);

			std::error_code ec;
			auto st = std::fs::status(path, ec);
			if(ec || !std::fs::exists(st))
			{
				error("skipping nonexistent input '%s'", input);
				continue;
			}

			bool wantDir = (mode == config::Mode::Rename || mode == config::Mode::Backup || mode == config::Mode::Photos
				|| mode == config::Mode::Move);
			if(wantDir && !std::fs::is_directory(st))
			{
				error("skipping '%s' (not a directory)", input);
				continue;
			}
			else if(!wantDir && !std::fs::is_regular_file(st))
			{
				error("skipping '%s' (not a file)", input);
				continue;
			}

			if(mode == config::Mode::Extract && extract::detectArchive(path) == extract::ArchiveKind::None)
			{
				error("skipping '%s' (not a supported archive)", input);
				continue;
			}

			ret.push_back(path);
		}

		return ret;
	}
}
