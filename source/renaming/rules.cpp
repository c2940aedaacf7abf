// rules.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

namespace rules
{
	// the <ctype.h> versions depend on the locale, and we only care about ascii here.
	static bool is_digit(char c) { return c >= '0' && c <= '9'; }
	static bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
	static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
	static bool is_alpha(char c) { return is_lower(c) || is_upper(c); }

	std::string kindName(Kind kind)
	{
		switch(kind)
		{
			case Kind::Literal:     return "literal";
			case Kind::Regex:       return "regex";
			case Kind::SmartSpace:  return "smart_space";
			case Kind::DigitSpace:  return "digit_space";
		}

		return "";
	}

	std::optional<Kind> parseKind(const std::string& s)
	{
		auto x = util::lowercase(util::trim(s));

		// 'simple' and 'space' are what the old pattern files called these.
		if(x == "literal" || x == "simple")     return Kind::Literal;
		if(x == "regex")                        return Kind::Regex;
		if(x == "smart_space")                  return Kind::SmartSpace;
		if(x == "digit_space" || x == "space")  return Kind::DigitSpace;

		return std::nullopt;
	}

	std::string replaceLiteral(const std::string& input, const std::string& match, const std::string& replacement,
		bool caseSensitive)
	{
		if(match.empty())
			return input;

		// only the haystack and needle get folded; the replacement goes in as-is.
		auto hay = caseSensitive ? input : util::lowercase(input);
		auto needle = caseSensitive ? match : util::lowercase(match);

		std::string ret;
		size_t start = 0;

		while(true)
		{
			auto i = hay.find(needle, start);
			if(i == std::string::npos)
				break;

			ret += input.substr(start, i - start);
			ret += replacement;

			start = i + needle.size();
		}

		ret += input.substr(start);
		return ret;
	}

	std::string smartSpace(const std::string& input)
	{
		std::string ret;
		ret.reserve(input.size() * 2);

		for(size_t i = 0; i < input.size(); i++)
		{
			if(i > 0)
			{
				char a = input[i - 1];
				char b = input[i];

				if(is_digit(a) != is_digit(b) || (is_lower(a) && is_upper(b)))
					ret += ' ';
			}

			ret += input[i];
		}

		return ret;
	}

	std::string digitSpace(const std::string& input)
	{
		std::string ret;
		ret.reserve(input.size() * 2);

		for(size_t i = 0; i < input.size(); i++)
		{
			if(i > 0)
			{
				char a = input[i - 1];
				char b = input[i];

				if((is_digit(a) && is_alpha(b)) || (is_alpha(a) && is_digit(b)))
					ret += ' ';
			}

			ret += input[i];
		}

		return ret;
	}




	std::vector<Rule> parseRules(const std::string& text, std::vector<std::string>* errors)
	{
		std::vector<Rule> ret;

		auto complain = [&errors](const std::string& msg) {
			if(errors) errors->push_back(msg);
		};

		size_t lineNum = 0;
		for(auto line : util::splitString(text))
		{
			lineNum += 1;

			if(!line.empty() && line.back() == '\r')
				line.pop_back();

			if(util::trim(line).empty() || line[0] == '#')
				continue;

			auto fields = util::splitEscaped(line, '|');
			if(fields.size() < 3)
			{
				complain(zpr::sprint("line %d: expected 'match|replacement|kind[|case_sensitive]'", lineNum));
				continue;
			}

			Rule rule;
			rule.match = fields[0];
			rule.replacement = fields[1];

			if(auto k = parseKind(fields[2]); k.has_value())
			{
				rule.kind = *k;
			}
			else
			{
				complain(zpr::sprint("line %d: unknown rule kind '%s'", lineNum, fields[2]));
				continue;
			}

			if(fields.size() > 3)
			{
				auto cs = util::lowercase(util::trim(fields[3]));
				if(cs == "true" || cs == "1" || cs.empty())
				{
					rule.caseSensitive = true;
				}
				else if(cs == "false" || cs == "0")
				{
					rule.caseSensitive = false;
				}
				else
				{
					complain(zpr::sprint("line %d: expected 'true' or 'false' for case sensitivity, found '%s'",
						lineNum, fields[3]));
					continue;
				}
			}

			ret.push_back(rule);
		}

		return ret;
	}

	std::string serialiseRules(const std::vector<Rule>& rules)
	{
		std::string ret;
		for(const auto& r : rules)
		{
			auto match = util::escapeField(r.match);

			// otherwise it'd be read back as a comment.
			if(!match.empty() && match[0] == '#')
				match = "\\" + match;

			ret += zpr::sprint("%s|%s|%s|%s\n", match, util::escapeField(r.replacement), kindName(r.kind),
				r.caseSensitive ? "true" : "false");
		}

		return ret;
	}

	bool readRuleFile(const std::fs::path& path, std::vector<Rule>& out)
	{
		auto [ buf, sz ] = util::readEntireFile(path.string());
		if(!buf)
		{
			util::error("failed to read rule file '%s'", path.string());
			return false;
		}

		auto text = std::string(reinterpret_cast<char*>(buf), sz);
		delete[] buf;

		std::vector<std::string> errors;
		auto rules = parseRules(text, &errors);

		for(const auto& e : errors)
			util::error("%s: %s", path.filename().string(), e);

		if(!errors.empty())
			return false;

		out.insert(out.end(), rules.begin(), rules.end());
		return true;
	}

	bool writeRuleFile(const std::fs::path& path, const std::vector<Rule>& rules)
	{
		if(!util::writeEntireFile(path.string(), serialiseRules(rules)))
		{
			util::error("failed to write rule file '%s'", path.string());
			return false;
		}

		return true;
	}
}
