// helpers.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "helpers.h"

#include <unistd.h>

#include <fstream>
#include <algorithm>

#include <gtest/gtest.h>

namespace testutil
{
	TempDir::TempDir()
	{
		static int counter = 0;

		auto base = std::fs::temp_directory_path();
		do {
			this->dir = base / zpr::sprint("renaminator-test-%d-%d", getpid(), counter++);
		} while(std::fs::exists(this->dir));

		std::fs::create_directories(this->dir);
	}

	TempDir::~TempDir()
	{
		std::error_code ec;

		// tests take permissions away sometimes; give them back so everything can be removed.
		std::fs::permissions(this->dir, std::fs::perms::owner_all, std::fs::perm_options::add, ec);
		for(auto it = std::fs::recursive_directory_iterator(this->dir, ec); !ec && it != std::fs::recursive_directory_iterator();
			it.increment(ec))
		{
			if(it->is_directory(ec) && !it->is_symlink(ec))
				std::fs::permissions(it->path(), std::fs::perms::owner_all, std::fs::perm_options::add, ec);
		}

		std::fs::remove_all(this->dir, ec);
	}

	void writeFile(const std::fs::path& path, const std::string& contents)
	{
		std::fs::create_directories(path.parent_path());

		auto fs = std::ofstream(path, std::ios::out | std::ios::binary | std::ios::trunc);
		fs << contents;

		ASSERT_TRUE(fs.good()) << "could not write " << path.string();
	}

	std::string readFile(const std::fs::path& path)
	{
		auto [ buf, sz ] = util::readEntireFile(path.string());
		if(!buf)
			return "";

		auto ret = std::string(reinterpret_cast<char*>(buf), sz);
		delete[] buf;

		return ret;
	}

	std::vector<std::string> listTree(const std::fs::path& root)
	{
		std::vector<std::string> ret;
		for(const auto& entry : std::fs::recursive_directory_iterator(root))
		{
			auto rel = entry.path().lexically_relative(root).string();
			if(entry.is_directory())
				rel += "/";

			ret.push_back(rel);
		}

		std::sort(ret.begin(), ret.end());
		return ret;
	}

	config::Options scratchOptions(const TempDir& scratch)
	{
		config::Options opts;
		opts.showProgress = false;
		opts.backupFolder = (scratch / "backups").string();
		opts.operationLog = (scratch / "operations.log").string();

		return opts;
	}
}
