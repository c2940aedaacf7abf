// recorder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <sys/stat.h>

#include <fstream>
#include <algorithm>

#include <openssl/evp.h>

namespace backup
{
	std::optional<Digest> digestForChecksum(const std::string& hex)
	{
		if(hex.size() == 64)    return Digest::Sha256;
		if(hex.size() == 32)    return Digest::Md5;

		return std::nullopt;
	}

	std::string checksumFile(const std::fs::path& path, Digest digest)
	{
		auto fs = std::ifstream(path, std::ios::in | std::ios::binary);
		if(!fs.good())
			return "";

		EVP_MD_CTX* ctx = EVP_MD_CTX_new();
		if(!ctx)
			return "";

		defer(EVP_MD_CTX_free(ctx));

		auto md = (digest == Digest::Md5 ? EVP_md5() : EVP_sha256());
		if(EVP_DigestInit_ex(ctx, md, nullptr) != 1)
			return "";

		std::vector<char> buf(64 * 1024);
		while(fs)
		{
			fs.read(buf.data(), buf.size());

			auto n = fs.gcount();
			if(n > 0 && EVP_DigestUpdate(ctx, buf.data(), static_cast<size_t>(n)) != 1)
				return "";
		}

		// eof is fine, anything else means the read died halfway.
		if(fs.bad() || !fs.eof())
			return "";

		unsigned char out[EVP_MAX_MD_SIZE];
		unsigned int len = 0;
		if(EVP_DigestFinal_ex(ctx, out, &len) != 1)
			return "";

		constexpr const char* hex = "0123456789abcdef";

		std::string ret;
		for(unsigned int i = 0; i < len; i++)
		{
			ret += hex[(out[i] >> 4) & 0xF];
			ret += hex[out[i] & 0xF];
		}

		return ret;
	}

	static Entry record(const std::fs::path& path, const std::string& rel, std::vector<std::string>* unreadable)
	{
		Entry e;
		e.absolutePath = path.string();
		e.relativePath = rel;

		struct stat st;
		if(lstat(path.c_str(), &st) != 0)
		{
			// it was there when we listed the directory, so keep a placeholder for it.
			if(unreadable) unreadable->push_back(path.string());
			return e;
		}

		if(S_ISREG(st.st_mode))         e.type = ObjectType::File;
		else if(S_ISDIR(st.st_mode))    e.type = ObjectType::Directory;
		else                            e.type = ObjectType::Other;

		e.permissions = st.st_mode & 07777;
		e.sizeBytes = (e.type == ObjectType::Directory ? 0 : static_cast<uint64_t>(st.st_size));
		e.modifiedAt = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000 + st.st_mtim.tv_nsec;

		if(e.type == ObjectType::File)
		{
			e.checksum = checksumFile(path);
			if(e.checksum.empty() && unreadable)
				unreadable->push_back(path.string());
		}

		return e;
	}

	static void visit(const std::fs::path& dir, const std::string& rel, std::vector<Entry>& out,
		std::vector<std::string>* unreadable)
	{
		std::error_code ec;
		auto it = std::fs::directory_iterator(dir, ec);
		if(ec)
		{
			if(unreadable) unreadable->push_back(dir.string());
			return;
		}

		std::vector<std::fs::path> children;
		for(auto end = std::fs::directory_iterator(); it != end; it.increment(ec))
		{
			if(ec)
			{
				if(unreadable) unreadable->push_back(dir.string());
				break;
			}

			children.push_back(it->path());
		}

		std::sort(children.begin(), children.end());

		for(const auto& child : children)
		{
			auto name = child.filename().string();
			auto childRel = rel.empty() ? name : (std::fs::path(rel) / name).string();

			// don't follow symlinked directories.
			struct stat st;
			if(lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
				visit(child, childRel, out, unreadable);

			out.push_back(record(child, childRel, unreadable));
		}
	}

	std::vector<Entry> captureTree(const std::fs::path& root, std::vector<std::string>* unreadable)
	{
		std::vector<Entry> ret;

		visit(root, "", ret, unreadable);
		ret.push_back(record(root, "", unreadable));

		return ret;
	}

	std::fs::path defaultBackupFolder()
	{
		return config::getConfigFolder() / "backups";
	}

	static std::fs::path normalise(const std::fs::path& p)
	{
		std::error_code ec;
		auto ret = std::fs::absolute(p, ec).lexically_normal();
		if(ec)
			ret = p.lexically_normal();

		// "/foo/bar/" normalises to "/foo/bar/", which has an empty filename.
		if(!ret.has_filename() && ret.has_parent_path() && ret != ret.root_path())
			ret = ret.parent_path();

		return ret;
	}

	Result createBackup(const std::fs::path& _root, const config::Options& opts)
	{
		Result result;

		auto root = normalise(_root);
		{
			std::error_code ec;
			if(!std::fs::is_directory(root, ec))
			{
				result.error = ErrorKind::InaccessibleRoot;
				result.message = zpr::sprint("'%s' is not an accessible directory", root.string());
				return result;
			}

			auto probe = std::fs::directory_iterator(root, ec);
			if(ec)
			{
				result.error = ErrorKind::InaccessibleRoot;
				result.message = zpr::sprint("cannot read '%s': %s", root.string(), ec.message());
				return result;
			}
		}

		auto folder = normalise(opts.backupFolder.empty() ? defaultBackupFolder() : std::fs::path(opts.backupFolder));

		// the manifest has to survive whatever happens to the tree.
		if(util::isWithin(folder, root))
		{
			result.error = ErrorKind::ManifestWriteFailure;
			result.message = zpr::sprint("backup folder '%s' is inside '%s'", folder.string(), root.string());
			return result;
		}

		{
			std::error_code ec;
			std::fs::create_directories(folder, ec);
			if(ec)
			{
				result.error = ErrorKind::ManifestWriteFailure;
				result.message = zpr::sprint("cannot create backup folder '%s': %s", folder.string(), ec.message());
				return result;
			}
		}

		Manifest manifest;
		manifest.created = util::currentTimestamp("%Y-%m-%dT%H:%M:%S");
		manifest.root = root.string();
		manifest.entries = captureTree(root, &result.unreadable);

		auto stamp = util::currentTimestamp("%Y%m%d_%H%M%S");
		auto path = folder / zpr::sprint("manifest-%s.txt", stamp);

		auto taken = [](const std::fs::path& p) -> bool {
			std::error_code ec;
			return std::fs::exists(p, ec) || std::fs::exists(p.string() + ".part", ec);
		};

		// two backups in the same second.
		for(int n = 1; taken(path); n++)
			path = folder / zpr::sprint("manifest-%s-%d.txt", stamp, n);

		auto tmp = std::fs::path(path.string() + ".part");
		if(!util::writeEntireFile(tmp.string(), serialiseManifest(manifest)))
		{
			std::error_code ec;
			std::fs::remove(tmp, ec);

			result.error = ErrorKind::ManifestWriteFailure;
			result.message = zpr::sprint("failed to write manifest '%s'", path.string());
			return result;
		}

		{
			std::error_code ec;
			std::fs::rename(tmp, path, ec);
			if(ec)
			{
				result.error = ErrorKind::ManifestWriteFailure;
				result.message = zpr::sprint("failed to write manifest '%s': %s", path.string(), ec.message());

				std::fs::remove(tmp, ec);
				return result;
			}
		}

		result.manifestPath = path;
		result.entryCount = manifest.entries.size();

		return result;
	}
}
