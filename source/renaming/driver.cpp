// driver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <map>
#include <regex>
#include <algorithm>

#include "defs.h"

namespace renamer
{
	struct PreparedRule
	{
		const rules::Rule* rule = nullptr;

		std::optional<std::regex> regex;
		std::string compileError;
	};

	static std::vector<PreparedRule> prepare(const std::vector<rules::Rule>& rules)
	{
		std::vector<PreparedRule> ret;
		for(const auto& r : rules)
		{
			PreparedRule pr;
			pr.rule = &r;

			if(r.kind == rules::Kind::Regex)
			{
				auto flags = std::regex::ECMAScript;
				if(!r.caseSensitive)
					flags |= std::regex::icase;

				try
				{
					pr.regex = std::regex(r.match, flags);
				}
				catch(const std::regex_error& e)
				{
					pr.compileError = zpr::sprint("invalid regex '%s': %s", r.match, e.what());
				}
			}

			ret.push_back(std::move(pr));
		}

		return ret;
	}

	static std::optional<std::string> fold(const std::string& name, const std::vector<PreparedRule>& rules,
		bool keepExtension, std::string* err)
	{
		// a leading dot is part of the name, not an extension.
		std::string stem = name;
		std::string ext;
		if(keepExtension)
		{
			if(auto dot = name.rfind('.'); dot != std::string::npos && dot > 0)
			{
				stem = name.substr(0, dot);
				ext = name.substr(dot);
			}
		}

		for(const auto& pr : rules)
		{
			const auto& r = *pr.rule;
			switch(r.kind)
			{
				case rules::Kind::Literal:
					stem = rules::replaceLiteral(stem, r.match, r.replacement, r.caseSensitive);
					break;

				case rules::Kind::Regex:
					if(!pr.regex.has_value())
					{
						if(err) *err = pr.compileError;
						return std::nullopt;
					}

					try
					{
						stem = std::regex_replace(stem, *pr.regex, r.replacement);
					}
					catch(const std::regex_error& e)
					{
						// eg. error_complexity or error_stack on pathological patterns
						if(err) *err = zpr::sprint("regex '%s' failed: %s", r.match, e.what());
						return std::nullopt;
					}
					break;

				case rules::Kind::SmartSpace:
					stem = rules::smartSpace(stem);
					break;

				case rules::Kind::DigitSpace:
					stem = rules::digitSpace(stem);
					break;
			}
		}

		return stem + ext;
	}

	std::optional<std::string> foldName(const std::string& name, const std::vector<rules::Rule>& rules,
		bool keepExtension, std::string* err)
	{
		return fold(name, prepare(rules), keepExtension, err);
	}

	static bool isHidden(const std::fs::path& p)
	{
		auto name = p.filename().string();
		return !name.empty() && name[0] == '.';
	}

	std::vector<std::fs::path> collectFiles(const std::fs::path& root, bool skipHidden)
	{
		std::vector<std::fs::path> ret;

		std::error_code ec;
		auto it = std::fs::recursive_directory_iterator(root, std::fs::directory_options::skip_permission_denied, ec);
		if(ec)
			return ret;

		for(auto end = std::fs::recursive_directory_iterator(); it != end; it.increment(ec))
		{
			if(ec)
			{
				util::warn("error while listing '%s': %s", root.string(), ec.message());
				break;
			}

			const auto& entry = *it;
			if(skipHidden && isHidden(entry.path()))
			{
				if(entry.is_directory(ec))
					it.disable_recursion_pending();

				continue;
			}

			// symlinks are left alone; is_regular_file() would follow them.
			if(entry.is_symlink(ec) || !entry.is_regular_file(ec))
				continue;

			ret.push_back(entry.path());
		}

		// directory iteration order is unspecified; sort so the progress is reproducible.
		std::sort(ret.begin(), ret.end());
		return ret;
	}

	static bool isValidName(const std::string& name)
	{
		return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos
			&& name.find('\0') == std::string::npos;
	}

	static bool targetTaken(const std::fs::path& original, const std::fs::path& target)
	{
		std::error_code ec;
		if(!std::fs::exists(std::fs::symlink_status(target, ec)))
			return false;

		// case-only renames on a case-insensitive filesystem find the file itself.
		return !std::fs::equivalent(original, target, ec);
	}

	Outcome applyRules(const std::fs::path& root, const std::vector<rules::Rule>& rules, const config::Options& opts,
		const ProgressFn& progress)
	{
		Outcome outcome;
		outcome.dryRun = opts.dryRun;

		{
			std::error_code ec;
			if(!std::fs::is_directory(root, ec))
			{
				outcome.fatal = ErrorKind::InaccessibleRoot;
				outcome.message = zpr::sprint("'%s' is not an accessible directory", root.string());
				return outcome;
			}

			auto probe = std::fs::directory_iterator(root, ec);
			if(ec)
			{
				outcome.fatal = ErrorKind::InaccessibleRoot;
				outcome.message = zpr::sprint("cannot read '%s': %s", root.string(), ec.message());
				return outcome;
			}
		}

		auto files = collectFiles(root, opts.skipHidden);
		auto prepared = prepare(rules);

		outcome.totalCandidates = files.size();


		// work out every new name first; nothing is moved until the whole batch is known to be safe.
		std::vector<bool> pending(files.size(), false);
		std::map<std::fs::path, std::vector<size_t>> targets;

		for(size_t i = 0; i < files.size(); i++)
		{
			FileResult res;
			res.original = files[i];
			res.target = files[i];

			auto base = files[i].filename().string();

			std::string err;
			auto newname = fold(base, prepared, opts.keepExtension, &err);

			if(!newname.has_value())
			{
				res.status = Status::Failed;
				res.error = ErrorKind::InvalidPattern;
				res.message = err;
			}
			else if(*newname == base)
			{
				res.status = Status::Unchanged;
			}
			else if(!isValidName(*newname))
			{
				res.status = Status::Failed;
				res.error = ErrorKind::InvalidTargetName;
				res.message = zpr::sprint("'%s' is not a valid file name", *newname);
			}
			else
			{
				res.target = files[i].parent_path() / *newname;
				pending[i] = true;

				targets[res.target].push_back(i);
			}

			outcome.files.push_back(res);
		}

		for(const auto& [ target, idxs ] : targets)
		{
			for(auto i : idxs)
			{
				auto& res = outcome.files[i];
				if(idxs.size() > 1)
				{
					res.message = zpr::sprint("%d files would be renamed to '%s'", idxs.size(), target.filename().string());
				}
				else if(targetTaken(res.original, target))
				{
					res.message = zpr::sprint("'%s' already exists", target.filename().string());
				}
				else
				{
					continue;
				}

				res.status = Status::Failed;
				res.error = ErrorKind::NameCollision;
				pending[i] = false;
			}
		}


		for(size_t i = 0; i < files.size(); i++)
		{
			auto& res = outcome.files[i];
			if(pending[i])
			{
				if(opts.dryRun)
				{
					res.status = Status::WouldRename;
				}
				else if(targetTaken(res.original, res.target))
				{
					// appeared since we planned.
					res.status = Status::Failed;
					res.error = ErrorKind::NameCollision;
					res.message = zpr::sprint("'%s' already exists", res.target.filename().string());
				}
				else
				{
					std::error_code ec;
					std::fs::rename(res.original, res.target, ec);

					if(ec)
					{
						res.status = Status::Failed;
						res.error = ErrorKind::RenameFailed;
						res.message = ec.message();
					}
					else
					{
						res.status = Status::Renamed;
					}
				}
			}

			if(res.status == Status::Renamed || res.status == Status::WouldRename)
				outcome.renamedCount += 1;

			else if(res.status == Status::Failed)
				outcome.errorCount += 1;

			if(progress)
			{
				// (i + 1) * 100 / n is exactly 100 for the last file, and below it for the rest.
				auto pct = (static_cast<double>(i + 1) * 100.0) / static_cast<double>(files.size());
				progress(pct, zpr::sprint("processing %d of %d", i + 1, files.size()));
			}
		}

		if(files.empty() && progress)
			progress(100.0, "no files");

		return outcome;
	}
}
