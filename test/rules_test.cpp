// rules_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "helpers.h"

using rules::Kind;
using rules::Rule;

static std::string fold(const std::string& name, const std::vector<Rule>& rs, bool keepExtension = false)
{
	std::string err;
	auto ret = renamer::foldName(name, rs, keepExtension, &err);

	EXPECT_TRUE(ret.has_value()) << err;
	return ret.value_or("");
}

TEST(Rules, LiteralReplacesEveryOccurrence)
{
	EXPECT_EQ(rules::replaceLiteral("my_holiday_video.mp4", "_", " ", true), "my holiday video.mp4");
	EXPECT_EQ(rules::replaceLiteral("My_File_Name.mp4", "_", " ", true), "My File Name.mp4");
	EXPECT_EQ(rules::replaceLiteral("aaaa", "aa", "b", true), "bb");
	EXPECT_EQ(rules::replaceLiteral("abc", "", "x", true), "abc");
}

TEST(Rules, LiteralCaseInsensitiveKeepsReplacementAsGiven)
{
	EXPECT_EQ(rules::replaceLiteral("Draft-DRAFT-draft.txt", "draft", "Final", false), "Final-Final-Final.txt");
	EXPECT_EQ(rules::replaceLiteral("Draft-DRAFT-draft.txt", "draft", "Final", true), "Draft-DRAFT-Final.txt");
}

TEST(Rules, SmartSpace)
{
	EXPECT_EQ(rules::smartSpace("Movie2023HDR"), "Movie 2023 HDR");
	EXPECT_EQ(rules::smartSpace("S01E02"), "S 01 E 02");
	EXPECT_EQ(rules::smartSpace("holidayVideo"), "holiday Video");
	EXPECT_EQ(rules::smartSpace("a-1"), "a- 1");
	EXPECT_EQ(rules::smartSpace(""), "");
}

TEST(Rules, DigitSpaceOnlySplitsDigitsFromLetters)
{
	EXPECT_EQ(rules::digitSpace("S01E02"), "S 01 E 02");
	EXPECT_EQ(rules::digitSpace("holidayVideo"), "holidayVideo");
	EXPECT_EQ(rules::digitSpace("a-1"), "a-1");
	EXPECT_EQ(rules::digitSpace("track7.flac"), "track 7.flac");
}

TEST(Rules, RegexWithGroups)
{
	auto rs = std::vector<Rule> {
		Rule { "([0-9]{4})-([0-9]{2})-([0-9]{2})", "$3.$2.$1", Kind::Regex, true },
	};

	EXPECT_EQ(fold("photo 2023-07-14.jpg", rs), "photo 14.07.2023.jpg");
}

TEST(Rules, RegexCaseInsensitive)
{
	auto rs = std::vector<Rule> { Rule { "^img_", "", Kind::Regex, false } };
	EXPECT_EQ(fold("IMG_0042.JPG", rs), "0042.JPG");

	auto cs = std::vector<Rule> { Rule { "^img_", "", Kind::Regex, true } };
	EXPECT_EQ(fold("IMG_0042.JPG", cs), "IMG_0042.JPG");
}

TEST(Rules, InvalidRegexFailsTheName)
{
	auto rs = std::vector<Rule> { Rule { "([a-z", "x", Kind::Regex, true } };

	std::string err;
	EXPECT_FALSE(renamer::foldName("abc", rs, false, &err).has_value());
	EXPECT_FALSE(err.empty());
}

TEST(Rules, AppliedInOrder)
{
	auto rs = std::vector<Rule> {
		Rule { "_", " ", Kind::Literal, true },
		Rule { "", "", Kind::SmartSpace, true },
		Rule { "  ", " ", Kind::Literal, true },
	};

	EXPECT_EQ(fold("show_S01E02", rs), "show S 01 E 02");
}

TEST(Rules, KeepExtension)
{
	auto rs = std::vector<Rule> { Rule { "", "", Kind::DigitSpace, true } };

	EXPECT_EQ(fold("clip2.mp4", rs, /* keepExtension: */ true), "clip 2.mp4");
	EXPECT_EQ(fold("clip2.mp4", rs, /* keepExtension: */ false), "clip 2.mp 4");

	// a leading dot is not an extension.
	EXPECT_EQ(fold(".rc2", rs, true), ".rc 2");
}

TEST(Rules, ParseKindAliases)
{
	EXPECT_EQ(rules::parseKind("simple"), Kind::Literal);
	EXPECT_EQ(rules::parseKind("literal"), Kind::Literal);
	EXPECT_EQ(rules::parseKind("space"), Kind::DigitSpace);
	EXPECT_EQ(rules::parseKind("smart_space"), Kind::SmartSpace);
	EXPECT_EQ(rules::parseKind(" REGEX "), Kind::Regex);
	EXPECT_FALSE(rules::parseKind("glob").has_value());
}

TEST(Rules, ParseRuleText)
{
	auto text = std::string(
		"# cleanup rules\n"
		"\n"
		"_| |simple|true\n"
		"^(\\d+)\\.|Track $1 -|regex|false\n"
		"||smart_space\n"
		"a\\|b|c|literal|true\n"
	);

	std::vector<std::string> errors;
	auto rs = rules::parseRules(text, &errors);

	EXPECT_TRUE(errors.empty());
	ASSERT_EQ(rs.size(), 4u);

	EXPECT_EQ(rs[0].match, "_");
	EXPECT_EQ(rs[0].replacement, " ");
	EXPECT_EQ(rs[0].kind, Kind::Literal);

	EXPECT_EQ(rs[1].match, "^(\\d+)\\.");
	EXPECT_EQ(rs[1].kind, Kind::Regex);
	EXPECT_FALSE(rs[1].caseSensitive);

	EXPECT_EQ(rs[2].kind, Kind::SmartSpace);
	EXPECT_TRUE(rs[2].caseSensitive);

	EXPECT_EQ(rs[3].match, "a|b");
}

TEST(Rules, ParseRuleTextReportsBadLines)
{
	std::vector<std::string> errors;
	auto rs = rules::parseRules("x|y\nx|y|glob|true\nx|y|literal|maybe\nok|fine|literal|false\n", &errors);

	ASSERT_EQ(rs.size(), 1u);
	EXPECT_EQ(rs[0].match, "ok");
	ASSERT_EQ(errors.size(), 3u);
	EXPECT_EQ(errors[0].find("line 1"), 0u);
	EXPECT_EQ(errors[2].find("line 3"), 0u);
}

TEST(Rules, RuleFileRoundTrip)
{
	testutil::TempDir tmp;

	auto rs = std::vector<Rule> {
		Rule { "#tag", "", Kind::Literal, true },
		Rule { "a|b\\c", "line\nbreak", Kind::Literal, false },
		Rule { "(\\w+)_(\\w+)", "$2 $1", Kind::Regex, true },
		Rule { "", "", Kind::DigitSpace, true },
	};

	auto path = tmp / "rules.txt";
	ASSERT_TRUE(rules::writeRuleFile(path, rs));

	std::vector<Rule> back;
	ASSERT_TRUE(rules::readRuleFile(path, back));
	ASSERT_EQ(back.size(), rs.size());

	for(size_t i = 0; i < rs.size(); i++)
	{
		EXPECT_EQ(back[i].match, rs[i].match);
		EXPECT_EQ(back[i].replacement, rs[i].replacement);
		EXPECT_EQ(back[i].kind, rs[i].kind);
		EXPECT_EQ(back[i].caseSensitive, rs[i].caseSensitive);
	}
}
