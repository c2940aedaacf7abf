// misc.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <iostream>

namespace misc
{
	bool confirm(const std::string& question, bool def)
	{
		while(true)
		{
			zpr::print("%s %s*%s %s [%s]: ", std::string(2 * util::get_log_indent(), ' '),
				COLOUR_BLUE_BOLD, COLOUR_RESET, question, def ? "Y/n" : "y/N");

			fflush(stdout);

			std::string input;
			if(!std::getline(std::cin, input))
			{
				// no more input; take the default rather than looping forever.
				zpr::println("");
				return def;
			}

			input = util::lowercase(util::trim(input));

			if(input.empty())
				return def;

			else if(input == "y" || input == "yes")
				return true;

			else if(input == "n" || input == "no")
				return false;

			util::error("invalid response '%s'", input);
		}
	}
}

const char* errorKindName(ErrorKind kind)
{
	switch(kind)
	{
		case ErrorKind::None:                       return "none";
		case ErrorKind::InaccessibleRoot:           return "inaccessible root";
		case ErrorKind::UnreadableObject:           return "unreadable object";
		case ErrorKind::InvalidPattern:             return "invalid pattern";
		case ErrorKind::InvalidTargetName:          return "invalid target name";
		case ErrorKind::NameCollision:              return "name collision";
		case ErrorKind::RenameFailed:               return "rename failed";
		case ErrorKind::ManifestWriteFailure:       return "manifest write failure";
		case ErrorKind::InvalidManifest:            return "invalid manifest";
		case ErrorKind::UnresolvableRestoreEntry:   return "unresolvable restore entry";
		case ErrorKind::MissingDependency:          return "missing dependency";
		case ErrorKind::ToolFailed:                 return "tool failed";
		case ErrorKind::Cancelled:                  return "cancelled";
	}

	return "unknown";
}

namespace util
{
	std::string uglyPrintTime(uint64_t ns, bool ms)
	{
		auto hours = ns / (1000ULL * 1000 * 1000 * 60 * 60);
		auto mins = (ns / (1000ULL * 1000 * 1000 * 60)) % 60;
		auto secs = (ns / (1000ULL * 1000 * 1000)) % 60;
		auto mils = (ns / (1000ULL * 1000)) % 1000;

		if(ms)  return zpr::sprint("%02d:%02d:%02d.%03d", hours, mins, secs, mils);
		else    return zpr::sprint("%02d:%02d:%02d", hours, mins, secs);
	}
}
