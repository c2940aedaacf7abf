// utils.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <errno.h>
#include <time.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/ioctl.h>

#include <stdlib.h>
#include <fstream>
#include <algorithm>

namespace util
{
	std::string getEnvironmentVar(const std::string& name)
	{
		if(char* val = getenv(name.c_str()); val)
			return std::string(val);

		else
			return "";
	}


	size_t getFileSize(const std::string& path)
	{
		struct stat st;
		if(stat(path.c_str(), &st) != 0)
		{
			char buf[128] = { 0 };
			strerror_r(errno, buf, 127);
			util::error("failed to get filesize for '%s' (error code %d / %s)", path, errno, buf);

			return -1;
		}

		return st.st_size;
	}

	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path)
	{
		auto bad = std::pair<uint8_t*, size_t>(nullptr, 0);

		auto sz = getFileSize(path);
		if(sz == static_cast<size_t>(-1)) return bad;

		// i'm lazy, so just use fstreams.
		auto fs = std::ifstream(path, std::ios::in | std::ios::binary);
		if(!fs.good()) return bad;


		uint8_t* buf = new uint8_t[sz + 1];
		fs.read(reinterpret_cast<char*>(buf), sz);

		if(static_cast<size_t>(fs.gcount()) != sz)
		{
			delete[] buf;
			return bad;
		}

		buf[sz] = 0;
		return std::pair(buf, sz);
	}

	bool writeEntireFile(const std::string& path, const std::string& contents)
	{
		auto fs = std::ofstream(path, std::ios::out | std::ios::binary | std::ios::trunc);
		if(!fs.good()) return false;

		fs.write(contents.data(), contents.size());
		fs.close();

		return !fs.fail();
	}

	std::string escapeField(const std::string& s)
	{
		std::string ret;
		ret.reserve(s.size());

		for(char c : s)
		{
			if(c == '|')        ret += "\\|";
			else if(c == '\\')  ret += "\\\\";
			else if(c == '\n')  ret += "\\n";
			else                ret += c;
		}

		return ret;
	}

	std::vector<std::string> splitEscaped(const std::string& line, char delim)
	{
		std::vector<std::string> ret;
		std::string cur;

		for(size_t i = 0; i < line.size(); i++)
		{
			// only undo what escapeField() did, so a hand-written '\d' in a regex survives.
			if(line[i] == '\\' && i + 1 < line.size() && (line[i + 1] == delim || line[i + 1] == '\\'
				|| line[i + 1] == 'n' || line[i + 1] == '#'))
			{
				i++;
				if(line[i] == 'n')  cur += '\n';
				else                cur += line[i];
			}
			else if(line[i] == delim)
			{
				ret.push_back(cur);
				cur.clear();
			}
			else
			{
				cur += line[i];
			}
		}

		ret.push_back(cur);
		return ret;
	}

	std::string currentTimestamp(const char* fmt)
	{
		auto now = time(nullptr);

		struct tm tm;
		localtime_r(&now, &tm);

		char buf[64] = { 0 };
		strftime(buf, sizeof(buf) - 1, fmt, &tm);

		return buf;
	}

	std::string shellQuote(const std::string& s)
	{
		std::string ret = "'";
		for(char c : s)
		{
			if(c == '\'')   ret += "'\\''";
			else            ret += c;
		}

		return ret + "'";
	}

	std::fs::path findProgram(const std::string& name)
	{
		if(name.find('/') != std::string::npos)
			return access(name.c_str(), X_OK) == 0 ? std::fs::path(name) : std::fs::path();

		for(const auto& dir : splitString(getEnvironmentVar("PATH"), ':'))
		{
			if(dir.empty())
				continue;

			auto candidate = std::fs::path(dir) / name;
			if(access(candidate.c_str(), X_OK) == 0)
				return candidate;
		}

		return { };
	}

	bool isWithin(const std::fs::path& path, const std::fs::path& base)
	{
		auto p = path.lexically_normal();
		auto b = base.lexically_normal();

		auto [ bi, pi ] = std::mismatch(b.begin(), b.end(), p.begin(), p.end());

		// a trailing separator shows up as an empty last component.
		return bi == b.end() || (std::next(bi) == b.end() && bi->empty());
	}

	void logOperation(const std::string& path, const std::string& msg)
	{
		if(path.empty())
			return;

		std::error_code ec;
		std::fs::create_directories(std::fs::path(path).parent_path(), ec);

		auto fs = std::ofstream(path, std::ios::out | std::ios::app);
		if(!fs.good())
		{
			util::warn("could not open operation log '%s'", path);
			return;
		}

		fs << "[" << currentTimestamp("%Y-%m-%d %H:%M:%S") << "] " << msg << "\n";
	}




	static bool progressLineActive = false;
	void printProgress(double percent, const std::string& _msg)
	{
		auto pad = std::string(2 * get_log_indent(), ' ');

		// don't let the line wrap, or \r won't take us back to the start of it.
		auto msg = _msg;
		if(auto tw = getTerminalWidth(); pad.size() + msg.size() + 10 > tw)
			msg = msg.substr(0, tw > pad.size() + 13 ? tw - pad.size() - 13 : 0) + "...";

		std::string line;
		if(percent >= 0)    line = zpr::sprint("%s %s*%s %3d%s %s", pad, COLOUR_MAGENTA_BOLD, COLOUR_RESET, static_cast<int>(percent), "%", msg);
		else                line = zpr::sprint("%s %s*%s %s", pad, COLOUR_MAGENTA_BOLD, COLOUR_RESET, msg);

		fprintf(stderr, "\x1b[2K\r%s\r", line.c_str());
		progressLineActive = true;
	}

	void finishProgress()
	{
		if(progressLineActive)
			fprintf(stderr, "\n");

		progressLineActive = false;
	}




#ifdef _MSC_VER
#else
	#pragma GCC diagnostic push
	#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

	size_t getTerminalWidth()
	{
		struct winsize w;
		if(ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0)
			return 80;

		return w.ws_col;
	}

#ifdef _MSC_VER
#else
	#pragma GCC diagnostic pop
#endif


















	static int log_indent = 0;
	void indent_log(int n)    { log_indent += n; }
	void unindent_log(int n)  { log_indent = std::max(0, log_indent - n); }
	int get_log_indent()      { return log_indent; }
}
