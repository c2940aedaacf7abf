// manifest.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <errno.h>

namespace backup
{
	static constexpr const char* MANIFEST_MAGIC = "# renaminator-manifest";

	// the shell version of this wrote two comment lines instead of our one.
	static constexpr const char* LEGACY_ROOT_PREFIX = "# Original directory: ";

	static const char* type_letter(ObjectType t)
	{
		switch(t)
		{
			case ObjectType::File:      return "f";
			case ObjectType::Directory: return "d";
			case ObjectType::Other:     return "o";
		}

		return "o";
	}

	static std::string format_perms(uint32_t perms)
	{
		std::string ret;
		do {
			ret.insert(ret.begin(), static_cast<char>('0' + (perms & 7)));
			perms >>= 3;
		} while(perms > 0);

		return ret;
	}

	static std::string format_mtime(int64_t ns)
	{
		auto secs = ns / 1000000000;
		auto frac = ns % 1000000000;
		if(frac < 0)
			secs -= 1, frac += 1000000000;

		auto f = std::to_string(frac);
		return std::to_string(secs) + "." + std::string(9 - f.size(), '0') + f;
	}

	static bool parse_uint(const std::string& s, int base, uint64_t& out)
	{
		if(s.empty())
			return false;

		char* end = nullptr;
		errno = 0;
		out = strtoull(s.c_str(), &end, base);

		return errno == 0 && end && *end == 0 && s[0] != '-';
	}

	// "1700000000.123456789"; find's %T@ gives more fractional digits than that, so truncate.
	static bool parse_mtime(const std::string& s, int64_t& out)
	{
		auto dot = s.find('.');
		auto whole = s.substr(0, dot);
		auto frac = dot == std::string::npos ? "" : s.substr(dot + 1);

		bool negative = !whole.empty() && whole[0] == '-';
		if(negative)
			whole = whole.substr(1);

		uint64_t secs = 0;
		if(!parse_uint(whole, 10, secs))
			return false;

		uint64_t ns = 0;
		if(!frac.empty())
		{
			frac = frac.substr(0, 9);
			frac += std::string(9 - frac.size(), '0');

			if(!parse_uint(frac, 10, ns))
				return false;
		}

		auto total = static_cast<int64_t>(secs) * 1000000000 + static_cast<int64_t>(ns);
		out = negative ? -total : total;
		return true;
	}

	std::string serialiseManifest(const Manifest& manifest)
	{
		std::string ret = zpr::sprint("%s|%d|%s|%s\n", MANIFEST_MAGIC, manifest.version, manifest.created,
			util::escapeField(manifest.root));

		for(const auto& e : manifest.entries)
		{
			ret += zpr::sprint("%s|%s|%s|%s|%d|%s|%s\n", util::escapeField(e.absolutePath), util::escapeField(e.relativePath),
				type_letter(e.type), format_perms(e.permissions), e.sizeBytes, format_mtime(e.modifiedAt), e.checksum);
		}

		return ret;
	}

	bool parseManifest(const std::string& text, Manifest& out, std::string* err)
	{
		auto fail = [&err](const std::string& msg) -> bool {
			if(err) *err = msg;
			return false;
		};

		Manifest m;
		bool sawHeader = false;

		size_t lineNum = 0;
		for(auto line : util::splitString(text))
		{
			lineNum += 1;

			if(!line.empty() && line.back() == '\r')
				line.pop_back();

			if(line.empty())
				continue;

			if(line[0] == '#')
			{
				if(line.find(MANIFEST_MAGIC) == 0)
				{
					auto fields = util::splitEscaped(line, '|');
					if(fields.size() != 4)
						return fail(zpr::sprint("line %d: malformed header", lineNum));

					uint64_t ver = 0;
					if(!parse_uint(fields[1], 10, ver) || ver != 1)
						return fail(zpr::sprint("line %d: unsupported manifest version '%s'", lineNum, fields[1]));

					m.version = static_cast<int>(ver);
					m.created = fields[2];
					m.root = fields[3];
					sawHeader = true;
				}
				else if(line.find(LEGACY_ROOT_PREFIX) == 0)
				{
					m.root = line.substr(strlen(LEGACY_ROOT_PREFIX));
					sawHeader = true;
				}
				else if(line.find("# Backup created on ") == 0)
				{
					m.created = line.substr(strlen("# Backup created on "));
				}

				continue;
			}

			auto fields = util::splitEscaped(line, '|');
			if(fields.size() != 7)
				return fail(zpr::sprint("line %d: expected 7 fields, found %d", lineNum, fields.size()));

			Entry e;
			e.absolutePath = fields[0];
			e.relativePath = fields[1];

			// anything that isn't a file or a directory is just 'other' (find -printf %y gives l, p, s, ...)
			if(fields[2] == "f")        e.type = ObjectType::File;
			else if(fields[2] == "d")   e.type = ObjectType::Directory;
			else if(fields[2].size() == 1)
				e.type = ObjectType::Other;
			else
				return fail(zpr::sprint("line %d: invalid object type '%s'", lineNum, fields[2]));

			uint64_t perms = 0;
			if(!parse_uint(fields[3], 8, perms))
				return fail(zpr::sprint("line %d: invalid permissions '%s'", lineNum, fields[3]));

			if(!parse_uint(fields[4], 10, e.sizeBytes))
				return fail(zpr::sprint("line %d: invalid size '%s'", lineNum, fields[4]));

			if(!parse_mtime(fields[5], e.modifiedAt))
				return fail(zpr::sprint("line %d: invalid modification time '%s'", lineNum, fields[5]));

			e.permissions = static_cast<uint32_t>(perms);
			e.checksum = fields[6];

			if(e.absolutePath.empty())
				return fail(zpr::sprint("line %d: empty path", lineNum));

			if(e.type != ObjectType::File && !e.checksum.empty())
				return fail(zpr::sprint("line %d: checksum recorded for a non-file", lineNum));

			m.entries.push_back(e);
		}

		if(!sawHeader)
			return fail("missing manifest header");

		if(m.root.empty())
			return fail("manifest does not name its root directory");

		out = m;
		return true;
	}
}
