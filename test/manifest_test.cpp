// manifest_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "helpers.h"

using backup::Entry;
using backup::Manifest;
using backup::ObjectType;

static Entry makeEntry(const std::string& abs, const std::string& rel, ObjectType type, uint32_t perms, uint64_t size,
	int64_t mtime, const std::string& sum)
{
	Entry e;
	e.absolutePath = abs;
	e.relativePath = rel;
	e.type = type;
	e.permissions = perms;
	e.sizeBytes = size;
	e.modifiedAt = mtime;
	e.checksum = sum;

	return e;
}

TEST(Manifest, SerialisedFormat)
{
	Manifest m;
	m.created = "2024-03-01T10:20:30";
	m.root = "/data/videos";
	m.entries.push_back(makeEntry("/data/videos/a.mp4", "a.mp4", ObjectType::File, 0644, 12, 1700000000123456789,
		"ab12"));
	m.entries.push_back(makeEntry("/data/videos", "", ObjectType::Directory, 0755, 0, 1700000000000000005, ""));

	auto lines = util::splitString(backup::serialiseManifest(m));
	ASSERT_EQ(lines.size(), 3u);

	EXPECT_EQ(lines[0], "# renaminator-manifest|1|2024-03-01T10:20:30|/data/videos");
	EXPECT_EQ(lines[1], "/data/videos/a.mp4|a.mp4|f|644|12|1700000000.123456789|ab12");
	EXPECT_EQ(lines[2], "/data/videos||d|755|0|1700000000.000000005|");
}

TEST(Manifest, EscapedPathsSurvive)
{
	Manifest m;
	m.created = "2024-03-01T10:20:30";
	m.root = "/tmp/we|ird";
	m.entries.push_back(makeEntry("/tmp/we|ird/back\\slash\nnewline", "back\\slash\nnewline", ObjectType::File,
		0600, 3, 42, "00ff"));

	Manifest back;
	std::string err;
	ASSERT_TRUE(backup::parseManifest(backup::serialiseManifest(m), back, &err)) << err;

	EXPECT_EQ(back.root, m.root);
	ASSERT_EQ(back.entries.size(), 1u);
	EXPECT_EQ(back.entries[0].absolutePath, m.entries[0].absolutePath);
	EXPECT_EQ(back.entries[0].relativePath, m.entries[0].relativePath);
	EXPECT_EQ(back.entries[0].permissions, 0600u);
	EXPECT_EQ(back.entries[0].modifiedAt, 42);
}

TEST(Manifest, AcceptsTheOldHeader)
{
	auto text = std::string(
		"# Backup created on Fri Mar  1 10:20:30 2024\n"
		"# Original directory: /home/me/stuff\n"
		"/home/me/stuff/link|link|l|777|4|1700000000.1234567890|\n"
		"/home/me/stuff||d|755|4096|1700000000.5|\n"
	);

	Manifest m;
	std::string err;
	ASSERT_TRUE(backup::parseManifest(text, m, &err)) << err;

	EXPECT_EQ(m.root, "/home/me/stuff");
	ASSERT_EQ(m.entries.size(), 2u);

	EXPECT_EQ(m.entries[0].type, ObjectType::Other);
	EXPECT_EQ(m.entries[0].modifiedAt, 1700000000123456789);

	EXPECT_EQ(m.entries[1].type, ObjectType::Directory);
	EXPECT_EQ(m.entries[1].modifiedAt, 1700000000500000000);
}

TEST(Manifest, RejectsMalformedInput)
{
	auto header = std::string("# renaminator-manifest|1|2024-03-01T10:20:30|/r\n");

	auto bad = std::vector<std::string> {
		"",
		"/r/a|a|f|644|1|1.0|x\n",
		header + "/r/a|a|f|644|1|1.0\n",
		header + "/r/a|a|file|644|1|1.0|x\n",
		header + "/r/a|a|f|9z|1|1.0|x\n",
		header + "/r/a|a|f|644|-1|1.0|x\n",
		header + "/r/a|a|f|644|1|soon|x\n",
		header + "/r/a|a|d|755|0|1.0|abcd\n",
		"# renaminator-manifest|2|2024-03-01T10:20:30|/r\n",
	};

	for(const auto& text : bad)
	{
		Manifest m;
		std::string err;
		EXPECT_FALSE(backup::parseManifest(text, m, &err)) << "accepted: " << text;
		EXPECT_FALSE(err.empty());
	}
}
