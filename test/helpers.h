// helpers.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include "defs.h"

namespace testutil
{
	// a fresh directory under the system temp folder, removed again when it goes out of scope.
	struct TempDir
	{
		TempDir();
		~TempDir();

		TempDir(const TempDir&) = delete;
		TempDir& operator = (const TempDir&) = delete;

		const std::fs::path& path() const { return this->dir; }
		std::fs::path operator / (const std::string& rel) const { return this->dir / rel; }

	private:
		std::fs::path dir;
	};

	// creates parent directories as needed.
	void writeFile(const std::fs::path& path, const std::string& contents);
	std::string readFile(const std::fs::path& path);

	// sorted, relative to 'root'; directories end in '/'.
	std::vector<std::string> listTree(const std::fs::path& root);

	// options that keep everything inside 'scratch' (backups, the operation log).
	config::Options scratchOptions(const TempDir& scratch);
}
