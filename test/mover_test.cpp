// mover_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "helpers.h"

namespace
{
	struct MoverTest : public ::testing::Test
	{
		testutil::TempDir scratch;
		testutil::TempDir tree;
		config::Options opts;

		std::fs::path dest;

		void SetUp() override
		{
			this->opts = testutil::scratchOptions(this->scratch);
			this->dest = this->scratch / "sorted";
		}

		mover::Outcome run(mover::Kind kind, const ProgressFn& progress = nullptr)
		{
			return mover::moveFiles(this->tree.path(), this->dest, kind, this->opts, progress);
		}

		void makeAlbum()
		{
			testutil::writeFile(tree / "a.JPG", "a");
			testutil::writeFile(tree / "trip/b.png", "b");
			testutil::writeFile(tree / "trip/notes.txt", "notes");
			testutil::writeFile(tree / "trip/day1/deep/more/c.webp", "c");
			testutil::writeFile(tree / "only_pics/d.gif", "d");
			std::fs::create_directories(tree / "empty_already");
		}
	};
}

TEST(Mover, Images)
{
	EXPECT_TRUE(mover::isImage("x.jpg"));
	EXPECT_TRUE(mover::isImage("x.JPEG"));
	EXPECT_TRUE(mover::isImage("dir/x.Png"));
	EXPECT_TRUE(mover::isImage("x.gif"));
	EXPECT_TRUE(mover::isImage("x.bmp"));
	EXPECT_TRUE(mover::isImage("x.tiff"));
	EXPECT_TRUE(mover::isImage("x.webp"));

	EXPECT_FALSE(mover::isImage("x.tif"));
	EXPECT_FALSE(mover::isImage("x.mp4"));
	EXPECT_FALSE(mover::isImage("jpg"));
	EXPECT_FALSE(mover::isImage("x.jpg.txt"));
}

TEST_F(MoverTest, PhotosAreGatheredFromAnyDepth)
{
	makeAlbum();

	auto res = run(mover::Kind::Photos);

	EXPECT_EQ(res.fatal, ErrorKind::None) << res.message;
	EXPECT_EQ(res.totalCandidates, 4u);
	EXPECT_EQ(res.movedCount, 4u);
	EXPECT_EQ(res.errorCount, 0u);

	EXPECT_EQ(testutil::listTree(dest), (std::vector<std::string> { "a.JPG", "b.png", "c.webp", "d.gif" }));
	EXPECT_EQ(testutil::readFile(dest / "c.webp"), "c");

	// everything left empty goes, along with what was empty to begin with; the rest stays.
	EXPECT_EQ(testutil::listTree(tree.path()), (std::vector<std::string> { "trip/", "trip/notes.txt" }));
	EXPECT_EQ(res.removedFolders.size(), 5u);
	EXPECT_TRUE(std::fs::is_directory(tree.path()));
}

TEST_F(MoverTest, RemovedFoldersComeDeepestFirst)
{
	testutil::writeFile(tree / "x/y/z/pic.png", "p");

	auto res = run(mover::Kind::Photos);
	ASSERT_EQ(res.removedFolders.size(), 3u);

	EXPECT_EQ(res.removedFolders[0].filename(), "z");
	EXPECT_EQ(res.removedFolders[1].filename(), "y");
	EXPECT_EQ(res.removedFolders[2].filename(), "x");
}

TEST_F(MoverTest, MoveStopsThreeLevelsDown)
{
	testutil::writeFile(tree / "top.txt", "1");
	testutil::writeFile(tree / "a/x.txt", "2");
	testutil::writeFile(tree / "a/b/y.mkv", "3");
	testutil::writeFile(tree / "a/b/c/z.txt", "4");
	std::fs::create_directories(tree / "e/f/g/h");

	auto res = run(mover::Kind::AllFiles);

	EXPECT_EQ(res.fatal, ErrorKind::None) << res.message;
	EXPECT_EQ(res.movedCount, 3u);

	EXPECT_EQ(testutil::listTree(dest), (std::vector<std::string> { "top.txt", "x.txt", "y.mkv" }));
	EXPECT_EQ(testutil::listTree(tree.path()), (std::vector<std::string> {
		"a/", "a/b/", "a/b/c/", "a/b/c/z.txt", "e/", "e/f/", "e/f/g/", "e/f/g/h/"
	}));
}

TEST_F(MoverTest, SameNamesAreNotMoved)
{
	testutil::writeFile(tree / "x/pic.jpg", "x");
	testutil::writeFile(tree / "y/pic.jpg", "y");
	testutil::writeFile(tree / "taken.png", "new");
	testutil::writeFile(tree / "fine.png", "fine");
	testutil::writeFile(dest / "taken.png", "old");

	auto res = run(mover::Kind::Photos);

	EXPECT_EQ(res.fatal, ErrorKind::None);
	EXPECT_EQ(res.movedCount, 1u);
	EXPECT_EQ(res.errorCount, 3u);

	for(const auto& f : res.files)
	{
		if(f.original.filename() == "fine.png")
		{
			EXPECT_EQ(f.status, mover::Status::Moved);
		}
		else
		{
			EXPECT_EQ(f.status, mover::Status::Failed) << f.original;
			EXPECT_EQ(f.error, ErrorKind::NameCollision) << f.original;
		}
	}

	EXPECT_EQ(testutil::readFile(dest / "taken.png"), "old");
	EXPECT_EQ(testutil::readFile(tree / "taken.png"), "new");
	EXPECT_EQ(testutil::readFile(tree / "x/pic.jpg"), "x");
	EXPECT_EQ(testutil::readFile(tree / "y/pic.jpg"), "y");
}

TEST_F(MoverTest, DryRunTouchesNothing)
{
	makeAlbum();
	auto before = testutil::listTree(tree.path());

	opts.dryRun = true;
	auto res = run(mover::Kind::Photos);

	EXPECT_TRUE(res.dryRun);
	EXPECT_EQ(res.movedCount, 4u);
	EXPECT_EQ(res.removedFolders.size(), 5u);

	for(const auto& f : res.files)
		EXPECT_EQ(f.status, mover::Status::WouldMove);

	EXPECT_EQ(testutil::listTree(tree.path()), before);
	EXPECT_FALSE(std::fs::exists(dest));
}

TEST_F(MoverTest, CreatesTheDestination)
{
	testutil::writeFile(tree / "a.png", "a");
	dest = scratch / "new/nested";

	auto res = run(mover::Kind::Photos);

	EXPECT_EQ(res.fatal, ErrorKind::None) << res.message;
	EXPECT_EQ(testutil::readFile(dest / "a.png"), "a");
}

TEST_F(MoverTest, RefusesBadFolders)
{
	testutil::writeFile(tree / "a.png", "a");

	dest = tree / "inside";
	EXPECT_EQ(run(mover::Kind::Photos).fatal, ErrorKind::InvalidTargetName);

	dest = tree.path();
	EXPECT_EQ(run(mover::Kind::AllFiles).fatal, ErrorKind::InvalidTargetName);

	testutil::writeFile(scratch / "a-file", "x");
	dest = scratch / "a-file";
	EXPECT_EQ(run(mover::Kind::Photos).fatal, ErrorKind::InvalidTargetName);

	auto missing = mover::moveFiles(tree / "nope", scratch / "sorted", mover::Kind::Photos, opts);
	EXPECT_EQ(missing.fatal, ErrorKind::InaccessibleRoot);

	EXPECT_TRUE(std::fs::exists(tree / "a.png"));
	EXPECT_FALSE(std::fs::exists(tree / "inside"));
}

TEST_F(MoverTest, HiddenThingsCanBeLeftAlone)
{
	testutil::writeFile(tree / ".cache/thumb.jpg", "t");
	testutil::writeFile(tree / ".cover.png", "c");
	testutil::writeFile(tree / "shown.png", "s");

	opts.skipHidden = true;
	auto res = run(mover::Kind::Photos);

	EXPECT_EQ(res.movedCount, 1u);
	EXPECT_EQ(testutil::listTree(tree.path()), (std::vector<std::string> { ".cache/", ".cache/thumb.jpg", ".cover.png" }));
}

TEST_F(MoverTest, ProgressEndsAtOneHundred)
{
	makeAlbum();

	std::vector<double> seen;
	run(mover::Kind::Photos, [&seen](double pct, const std::string&) { seen.push_back(pct); });

	ASSERT_EQ(seen.size(), 4u);
	for(size_t i = 1; i < seen.size(); i++)
		EXPECT_GT(seen[i], seen[i - 1]);

	EXPECT_DOUBLE_EQ(seen.back(), 100.0);
}

TEST_F(MoverTest, NothingToMove)
{
	testutil::writeFile(tree / "readme.txt", "r");

	std::vector<double> seen;
	auto res = run(mover::Kind::Photos, [&seen](double pct, const std::string&) { seen.push_back(pct); });

	EXPECT_EQ(res.totalCandidates, 0u);
	EXPECT_EQ(seen, (std::vector<double> { 100.0 }));
	EXPECT_TRUE(std::fs::exists(tree / "readme.txt"));
}
