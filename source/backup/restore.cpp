// restore.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <sys/stat.h>

#include <set>
#include <map>
#include <algorithm>

namespace restore
{
	std::fs::path consumedMarker(const std::fs::path& manifestPath)
	{
		return std::fs::path(manifestPath.string() + ".restored");
	}

	static size_t depth(const std::string& rel)
	{
		size_t n = 0;
		for(const auto& c : std::fs::path(rel))
		{
			if(!c.empty())
				n += 1;
		}

		return n;
	}

	// regular files under the root that aren't sitting at a recorded file path, keyed by checksum.
	// built lazily, since nobody needs it if all the names are already intact.
	struct OrphanIndex
	{
		bool built = false;
		std::vector<std::fs::path> files;

		// old manifests carry md5 sums, new ones sha256; hash each orphan only with the digests we're asked for.
		std::map<backup::Digest, std::multimap<std::string, std::fs::path>> byChecksum;
		std::set<std::fs::path> claimed;

		void build(const std::fs::path& root, const std::set<std::string>& recorded)
		{
			if(this->built)
				return;

			this->built = true;
			for(const auto& f : renamer::collectFiles(root, /* skipHidden: */ false))
			{
				if(recorded.count(f.string()) == 0)
					this->files.push_back(f);
			}
		}

		const std::multimap<std::string, std::fs::path>& sums(backup::Digest digest)
		{
			if(auto it = this->byChecksum.find(digest); it != this->byChecksum.end())
				return it->second;

			auto& ret = this->byChecksum[digest];
			for(const auto& f : this->files)
			{
				if(auto sum = backup::checksumFile(f, digest); !sum.empty())
					ret.emplace(sum, f);
			}

			return ret;
		}

		std::vector<std::fs::path> candidates(const std::string& checksum, backup::Digest digest)
		{
			std::vector<std::fs::path> ret;

			auto [ begin, end ] = this->sums(digest).equal_range(checksum);
			for(auto it = begin; it != end; ++it)
			{
				if(this->claimed.count(it->second) == 0)
					ret.push_back(it->second);
			}

			std::sort(ret.begin(), ret.end());
			return ret;
		}
	};

	static int64_t mtime_of(const std::fs::path& p)
	{
		struct stat st;
		if(lstat(p.c_str(), &st) != 0)
			return -1;

		return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000 + st.st_mtim.tv_nsec;
	}

	// renames happen in place, so the same directory is the best guess; after that, rename(2) keeps the mtime.
	// whatever is still tied has identical contents and metadata, so it doesn't matter which we take.
	static std::fs::path pick(const std::vector<std::fs::path>& cands, const backup::Entry& entry)
	{
		auto parent = std::fs::path(entry.absolutePath).parent_path();

		std::vector<std::fs::path> sameDir;
		for(const auto& c : cands)
		{
			if(c.parent_path() == parent)
				sameDir.push_back(c);
		}

		const auto& pool = sameDir.empty() ? cands : sameDir;
		for(const auto& c : pool)
		{
			if(mtime_of(c) == entry.modifiedAt)
				return c;
		}

		return pool.front();
	}

	static void unresolvable(EntryResult& r, const std::string& msg)
	{
		r.action = Action::Unresolvable;
		r.error = ErrorKind::UnresolvableRestoreEntry;
		r.message = msg;
	}

	static void restoreDirectory(const backup::Entry& entry, const struct stat* st, const config::Options& opts,
		EntryResult& r)
	{
		if(st)
		{
			if(S_ISDIR(st->st_mode))    r.action = Action::Present;
			else                        unresolvable(r, "something other than a directory is in the way");

			return;
		}

		if(opts.dryRun)
		{
			r.action = Action::WouldRecreate;
			return;
		}

		std::error_code ec;
		std::fs::create_directories(entry.absolutePath, ec);
		if(ec)
		{
			unresolvable(r, zpr::sprint("could not recreate directory: %s", ec.message()));
			return;
		}

		std::fs::permissions(entry.absolutePath, static_cast<std::fs::perms>(entry.permissions & 07777),
			std::fs::perm_options::replace, ec);

		if(ec)
			util::warn("could not restore permissions on '%s': %s", entry.absolutePath, ec.message());

		r.action = Action::Recreated;
	}

	static void restoreFile(const backup::Entry& entry, const struct stat* st, const config::Options& opts,
		OrphanIndex& orphans, const std::function<void ()>& buildOrphans, EntryResult& r)
	{
		auto checksum = util::lowercase(entry.checksum);
		auto digest = backup::digestForChecksum(checksum);

		if(!checksum.empty() && !digest.has_value())
		{
			unresolvable(r, zpr::sprint("unrecognised checksum '%s'", entry.checksum));
			return;
		}

		if(st)
		{
			if(!S_ISREG(st->st_mode))
			{
				unresolvable(r, "something other than a regular file is in the way");
			}
			else if(checksum.empty())
			{
				// it was unreadable when we backed it up, so the name is all we can check.
				r.action = Action::Present;
			}
			else if(auto sum = backup::checksumFile(entry.absolutePath, *digest); sum != checksum)
			{
				unresolvable(r, sum.empty() ? "file is unreadable" : "checksum mismatch");
			}
			else
			{
				r.action = Action::Present;
			}

			return;
		}

		if(checksum.empty())
		{
			unresolvable(r, "no checksum was recorded, cannot identify the file");
			return;
		}

		buildOrphans();

		auto cands = orphans.candidates(checksum, *digest);
		if(cands.empty())
		{
			unresolvable(r, "no file with matching contents");
			return;
		}

		auto from = pick(cands, entry);
		r.currentPath = from.string();

		orphans.claimed.insert(from);

		if(opts.dryRun)
		{
			r.action = Action::WouldRename;
			return;
		}

		std::error_code ec;
		std::fs::rename(from, entry.absolutePath, ec);
		if(ec)
		{
			unresolvable(r, zpr::sprint("rename from '%s' failed: %s", from.filename().string(), ec.message()));
			return;
		}

		r.action = Action::Renamed;
	}

	Outcome restore(const std::fs::path& manifestPath, const config::Options& opts)
	{
		Outcome outcome;

		auto fail = [&outcome](const std::string& msg) -> Outcome {
			outcome.fatal = ErrorKind::InvalidManifest;
			outcome.message = msg;
			return outcome;
		};

		{
			std::error_code ec;
			if(std::fs::exists(consumedMarker(manifestPath), ec))
				return fail(zpr::sprint("manifest '%s' has already been restored", manifestPath.string()));
		}

		backup::Manifest manifest;
		{
			auto [ buf, sz ] = util::readEntireFile(manifestPath.string());
			if(!buf)
				return fail(zpr::sprint("cannot read manifest '%s'", manifestPath.string()));

			auto text = std::string(reinterpret_cast<char*>(buf), sz);
			delete[] buf;

			std::string err;
			if(!backup::parseManifest(text, manifest, &err))
				return fail(zpr::sprint("%s: %s", manifestPath.filename().string(), err));
		}

		// the recorder wrote children before parents; we need it the other way around.
		std::vector<size_t> order(manifest.entries.size());
		for(size_t i = 0; i < order.size(); i++)
			order[i] = i;

		std::stable_sort(order.begin(), order.end(), [&manifest](size_t a, size_t b) -> bool {
			return depth(manifest.entries[a].relativePath) < depth(manifest.entries[b].relativePath);
		});

		std::set<std::string> recorded;
		for(const auto& e : manifest.entries)
		{
			if(e.type == backup::ObjectType::File)
				recorded.insert(e.absolutePath);
		}

		OrphanIndex orphans;
		auto buildOrphans = [&orphans, &manifest, &recorded]() {
			orphans.build(manifest.root, recorded);
		};

		for(auto i : order)
		{
			const auto& entry = manifest.entries[i];

			EntryResult r;
			r.path = entry.absolutePath;

			struct stat st;
			bool exists = lstat(entry.absolutePath.c_str(), &st) == 0;

			switch(entry.type)
			{
				case backup::ObjectType::Directory:
					restoreDirectory(entry, exists ? &st : nullptr, opts, r);
					break;

				case backup::ObjectType::File:
					restoreFile(entry, exists ? &st : nullptr, opts, orphans, buildOrphans, r);
					break;

				case backup::ObjectType::Other:
					if(exists)  r.action = Action::Present;
					else        unresolvable(r, "missing, and only files and directories can be restored");
					break;
			}

			if(r.action == Action::Unresolvable)
				outcome.unresolvedCount += 1;

			else if(r.action != Action::Present)
				outcome.restoredCount += 1;

			outcome.entries.push_back(r);
		}

		if(!opts.dryRun && outcome.unresolvedCount == 0)
		{
			auto marker = consumedMarker(manifestPath);
			if(!util::writeEntireFile(marker.string(), util::currentTimestamp("%Y-%m-%dT%H:%M:%S") + "\n"))
				util::warn("could not write '%s'", marker.string());
		}

		return outcome;
	}
}
