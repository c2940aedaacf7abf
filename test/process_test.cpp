// process_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <chrono>

#include <gtest/gtest.h>

#include "helpers.h"

TEST(Process, CapturesOutput)
{
	auto res = proc::run("echo hello; echo oops 1>&2");

	EXPECT_TRUE(res.ok());
	EXPECT_EQ(res.status, 0);
	EXPECT_EQ(res.out, "hello\n");
	EXPECT_EQ(res.err, "oops\n");
}

TEST(Process, NonZeroExitIsToolFailed)
{
	testutil::TempDir tmp;

	proc::Job job;
	job.cmdline = "exit 3";
	job.partialOutputs = { tmp / "partial" };
	job.tempFiles = { tmp / "temp" };

	testutil::writeFile(tmp / "partial", "half");
	testutil::writeFile(tmp / "temp", "scratch");

	config::Options opts;
	opts.pollIntervalMs = 10;

	proc::CancelToken cancel;
	auto res = proc::supervise(job, opts, cancel);

	EXPECT_EQ(res.error, ErrorKind::ToolFailed);
	EXPECT_EQ(res.status, 3);
	EXPECT_FALSE(std::fs::exists(tmp / "partial"));
	EXPECT_FALSE(std::fs::exists(tmp / "temp"));
}

TEST(Process, SuccessKeepsOutputsButDropsTemporaries)
{
	testutil::TempDir tmp;

	proc::Job job;
	job.cmdline = zpr::sprint("echo done > %s", util::shellQuote((tmp / "output").string()));
	job.partialOutputs = { tmp / "output" };
	job.tempFiles = { tmp / "temp" };

	testutil::writeFile(tmp / "temp", "scratch");

	config::Options opts;
	opts.pollIntervalMs = 10;

	proc::CancelToken cancel;
	auto res = proc::supervise(job, opts, cancel);

	EXPECT_TRUE(res.ok());
	EXPECT_EQ(testutil::readFile(tmp / "output"), "done\n");
	EXPECT_FALSE(std::fs::exists(tmp / "temp"));
}

TEST(Process, CancelledBeforeStarting)
{
	proc::Job job;
	job.cmdline = "exit 0";

	proc::CancelToken cancel;
	cancel.cancel();

	auto res = proc::supervise(job, config::Options(), cancel);
	EXPECT_EQ(res.error, ErrorKind::Cancelled);
}

TEST(Process, CancelKillsTheChildAndCleansUp)
{
	testutil::TempDir tmp;
	testutil::writeFile(tmp / "partial", "half");

	proc::Job job;
	job.cmdline = "sleep 30";
	job.partialOutputs = { tmp / "partial" };
	job.poll = []() -> std::pair<double, std::string> { return { -1, "waiting" }; };

	config::Options opts;
	opts.pollIntervalMs = 10;

	size_t polls = 0;
	proc::CancelToken cancel;

	auto start = std::chrono::steady_clock::now();
	auto res = proc::supervise(job, opts, cancel, [&polls, &cancel](double, const std::string& msg) {
		EXPECT_EQ(msg, "waiting");
		if(++polls == 2)
			cancel.cancel();
	});

	auto took = std::chrono::steady_clock::now() - start;

	EXPECT_EQ(res.error, ErrorKind::Cancelled);
	EXPECT_EQ(polls, 2u);
	EXPECT_LT(took, std::chrono::seconds(10));
	EXPECT_FALSE(std::fs::exists(tmp / "partial"));
}

TEST(Process, MissingDependency)
{
	EXPECT_FALSE(proc::checkDependencies({ "renaminator-no-such-program" }));
	EXPECT_TRUE(proc::checkDependencies({ "sh" }));
}
