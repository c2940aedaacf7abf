// arguments.cpp
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#define ARG_HELP                    "--help"
#define ARG_REPLACE                 "--replace"
#define ARG_IREPLACE                "--ireplace"
#define ARG_REGEX                   "--regex"
#define ARG_IREGEX                  "--iregex"
#define ARG_SMART_SPACE             "--smart-space"
#define ARG_DIGIT_SPACE             "--digit-space"
#define ARG_RULES_FILE              "--rules"
#define ARG_SAVE_RULES              "--save-rules"
#define ARG_BACKUP                  "--backup"
#define ARG_RESTORE                 "--restore"
#define ARG_EXTRACT                 "--extract"
#define ARG_COMPRESS                "--compress"
#define ARG_SUBTITLES               "--subtitles"
#define ARG_PHOTOS                  "--photos"
#define ARG_MOVE                    "--move"
#define ARG_DRY_RUN                 "--dry-run"
#define ARG_NO_BACKUP               "--no-backup"
#define ARG_BACKUP_FOLDER           "--backup-folder"
#define ARG_CONFIG_PATH             "--config"
#define ARG_NO_PROGRESS             "--no-progress"
#define ARG_STOP_ON_ERROR           "--stop-on-error"
#define ARG_DELETE_ARCHIVES         "--delete-archives"
#define ARG_CREATE_SUBFOLDER        "--subfolder"
#define ARG_SKIP_HIDDEN             "--skip-hidden"
#define ARG_KEEP_EXTENSION          "--keep-extension"
#define ARG_CONFIRM_KEEP            "--confirm"
#define ARG_POLL_INTERVAL           "--poll-interval"


static std::vector<std::pair<std::string, std::string>> helpList;
static void setupMap()
{
	helpList.push_back({ ARG_HELP,
		"show this help"
	});

	helpList.push_back({ ARG_REPLACE + std::string(" <text> <replacement>"),
		"replace every occurrence of <text> in each file name"
	});

	helpList.push_back({ ARG_IREPLACE + std::string(" <text> <replacement>"),
		"same as " ARG_REPLACE ", but ignoring case"
	});

	helpList.push_back({ ARG_REGEX + std::string(" <pattern> <replacement>"),
		"replace every match of the (ECMAScript) regex; the replacement may use $1, $2, etc."
	});

	helpList.push_back({ ARG_IREGEX + std::string(" <pattern> <replacement>"),
		"same as " ARG_REGEX ", but ignoring case"
	});

	helpList.push_back({ ARG_SMART_SPACE,
		"insert spaces between digits and non-digits, and before a capital following a lowercase letter"
	});

	helpList.push_back({ ARG_DIGIT_SPACE,
		"insert spaces between digits and letters"
	});

	helpList.push_back({ ARG_RULES_FILE + std::string(" <path>"),
		"append the rules in the given file ('match|replacement|kind|case_sensitive', one per line)"
	});

	helpList.push_back({ ARG_SAVE_RULES + std::string(" <path>"),
		"save the rules given on the command line to a file, for use with " ARG_RULES_FILE
	});

	helpList.push_back({ ARG_BACKUP,
		"only record a manifest of the input folders; don't rename anything"
	});

	helpList.push_back({ ARG_RESTORE,
		"restore the names recorded in the given manifest files"
	});

	helpList.push_back({ ARG_EXTRACT,
		"extract the given archives (rar, zip, 7z, tar.gz, tar.bz2, tar.xz)"
	});

	helpList.push_back({ ARG_COMPRESS + std::string(" <quality>"),
		"re-encode the given videos with ffmpeg; quality is one of 'high', 'medium' or 'low'"
	});

	helpList.push_back({ ARG_SUBTITLES + std::string(" <path>"),
		"add the subtitle file to the given videos"
	});

	helpList.push_back({ ARG_PHOTOS + std::string(" <dest>"),
		"move every image (jpg, jpeg, png, gif, bmp, tiff, webp) in the input folders into <dest>, then remove emptied folders"
	});

	helpList.push_back({ ARG_MOVE + std::string(" <dest>"),
		"move every file up to 3 levels deep in the input folders into <dest>, then remove emptied folders"
	});

	helpList.push_back({ ARG_DRY_RUN,
		"do everything normally, but do not modify any files"
	});

	helpList.push_back({ ARG_NO_BACKUP,
		"do not record a manifest before renaming"
	});

	helpList.push_back({ ARG_BACKUP_FOLDER + std::string(" <path>"),
		"where to write manifests (cannot be inside the folder being renamed)"
	});

	helpList.push_back({ ARG_CONFIG_PATH + std::string(" <path>"),
		"set the path to the configuration file to use"
	});

	helpList.push_back({ ARG_NO_PROGRESS,
		"disable progress indication"
	});

	helpList.push_back({ ARG_STOP_ON_ERROR,
		"exit immediately without processing further inputs, if any error is encountered"
	});

	helpList.push_back({ ARG_DELETE_ARCHIVES,
		"delete archives after they are successfully extracted"
	});

	helpList.push_back({ ARG_CREATE_SUBFOLDER,
		"extract each archive into a folder named after it"
	});

	helpList.push_back({ ARG_SKIP_HIDDEN,
		"ignore dot-files and dot-folders when renaming"
	});

	helpList.push_back({ ARG_KEEP_EXTENSION,
		"only apply the rules to the part of the name before the extension"
	});

	helpList.push_back({ ARG_CONFIRM_KEEP,
		"after renaming, ask whether to keep the changes (and restore them if not)"
	});

	helpList.push_back({ ARG_POLL_INTERVAL + std::string(" <ms>"),
		"how often to check on external programs and update progress (default 1000)"
	});
}

static void printHelp()
{
	if(helpList.empty())
		setupMap();

	printf("usage: renaminator [options] <inputs>\n\n");

	printf("options:\n");

	size_t maxl = 0;
	for(const auto& p : helpList)
	{
		if(p.first.length() > maxl)
			maxl = p.first.length();
	}

	maxl += 4;

	// ok
	for(const auto& [ opt, desc ] : helpList)
		printf("  %s%s%s\n", opt.c_str(), std::string(maxl - opt.length(), ' ').c_str(), desc.c_str());

	printf("\n");
}






namespace args
{
	template <typename... Args>
	[[noreturn]] static void fail(const std::string& fmt, Args&&... args)
	{
		util::error("%serror:%s %s", COLOUR_RED_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...));
		exit(-1);
	}

	static void setMode(config::Mode mode, const char* flag)
	{
		static const char* modeFlag = nullptr;
		if(modeFlag && strcmp(modeFlag, flag) != 0)
			fail("'%s' cannot be used together with '%s'", flag, modeFlag);

		modeFlag = flag;
		config::setMode(mode);
	}

	std::vector<std::string> parseCmdLineOpts(int argc, char** argv)
	{
		// quick thing: usually programs will not do anything if --help or --version is anywhere in the flags.
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_HELP))
			{
				printHelp();
				exit(0);
			}
		}

		// the config file goes first, so that flags always win over it no matter where --config appears.
		for(int i = 1; i < argc - 1; i++)
		{
			if(!strcmp(argv[i], ARG_CONFIG_PATH))
				config::setConfigPath(argv[++i]);
		}

		// returns the next argument, or dies trying.
		auto next = [&argc, &argv](int& i, const char* what) -> std::string {
			if(i == argc - 1)
				fail("expected %s after '%s' option", what, argv[i]);

			i++;
			return argv[i];
		};

		auto add_replacement = [&next](int& i, rules::Kind kind, bool caseSensitive) {
			auto match = next(i, "pattern");
			auto repl = next(i, "replacement");

			if(match.empty())
				fail("empty pattern");

			config::addRule(rules::Rule { match, repl, kind, caseSensitive });
		};

		std::vector<std::string> filenames;
		if(argc > 1)
		{
			// parse the command line opts
			for(int i = 1; i < argc; i++)
			{
				if(!strcmp(argv[i], ARG_REPLACE))
				{
					add_replacement(i, rules::Kind::Literal, true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_IREPLACE))
				{
					add_replacement(i, rules::Kind::Literal, false);
					continue;
				}
				else if(!strcmp(argv[i], ARG_REGEX))
				{
					add_replacement(i, rules::Kind::Regex, true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_IREGEX))
				{
					add_replacement(i, rules::Kind::Regex, false);
					continue;
				}
				else if(!strcmp(argv[i], ARG_SMART_SPACE))
				{
					config::addRule(rules::Rule { "", "", rules::Kind::SmartSpace, true });
					continue;
				}
				else if(!strcmp(argv[i], ARG_DIGIT_SPACE))
				{
					config::addRule(rules::Rule { "", "", rules::Kind::DigitSpace, true });
					continue;
				}
				else if(!strcmp(argv[i], ARG_RULES_FILE))
				{
					auto path = next(i, "path");

					std::vector<rules::Rule> xs;
					if(!rules::readRuleFile(path, xs))
						fail("could not load rules from '%s'", path);

					for(const auto& r : xs)
						config::addRule(r);

					continue;
				}
				else if(!strcmp(argv[i], ARG_SAVE_RULES))
				{
					config::setSaveRulesPath(next(i, "path"));
					continue;
				}
				else if(!strcmp(argv[i], ARG_BACKUP))
				{
					setMode(config::Mode::Backup, ARG_BACKUP);
					continue;
				}
				else if(!strcmp(argv[i], ARG_RESTORE))
				{
					setMode(config::Mode::Restore, ARG_RESTORE);
					continue;
				}
				else if(!strcmp(argv[i], ARG_EXTRACT))
				{
					setMode(config::Mode::Extract, ARG_EXTRACT);
					continue;
				}
				else if(!strcmp(argv[i], ARG_COMPRESS))
				{
					setMode(config::Mode::Compress, ARG_COMPRESS);

					auto q = next(i, "quality");
					if(!video::parseQuality(q))
						fail("invalid quality '%s' (expected 'high', 'medium' or 'low')", q);

					config::setVideoQuality(q);
					continue;
				}
				else if(!strcmp(argv[i], ARG_SUBTITLES))
				{
					setMode(config::Mode::Subtitles, ARG_SUBTITLES);
					config::setSubtitlePath(next(i, "path"));
					continue;
				}
				else if(!strcmp(argv[i], ARG_PHOTOS))
				{
					setMode(config::Mode::Photos, ARG_PHOTOS);
					config::setMoveDestination(next(i, "destination"));
					continue;
				}
				else if(!strcmp(argv[i], ARG_MOVE))
				{
					setMode(config::Mode::Move, ARG_MOVE);
					config::setMoveDestination(next(i, "destination"));
					continue;
				}
				else if(!strcmp(argv[i], ARG_DRY_RUN))
				{
					config::setIsDryRun(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_NO_BACKUP))
				{
					config::setIsBackupEnabled(false);
					continue;
				}
				else if(!strcmp(argv[i], ARG_BACKUP_FOLDER))
				{
					config::setBackupFolder(next(i, "path"));
					continue;
				}
				else if(!strcmp(argv[i], ARG_CONFIG_PATH))
				{
					// already read above.
					next(i, "path");
					continue;
				}
				else if(!strcmp(argv[i], ARG_POLL_INTERVAL))
				{
					auto x = next(i, "interval");

					char* end = nullptr;
					auto ms = strtol(x.c_str(), &end, 10);
					if(x.empty() || !end || *end != 0 || ms < 1 || ms > INT_MAX)
						fail("invalid poll interval '%s' (expected a positive number of milliseconds)", x);

					config::setPollInterval(static_cast<int>(ms));
					continue;
				}
				else if(!strcmp(argv[i], ARG_NO_PROGRESS))
				{
					config::setDisableProgress(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_STOP_ON_ERROR))
				{
					config::setShouldStopOnError(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_DELETE_ARCHIVES))
				{
					config::setShouldDeleteArchives(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_CREATE_SUBFOLDER))
				{
					config::setShouldCreateSubfolder(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_SKIP_HIDDEN))
				{
					config::setShouldSkipHidden(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_KEEP_EXTENSION))
				{
					config::setShouldKeepExtension(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_CONFIRM_KEEP))
				{
					config::setShouldConfirmKeep(true);
					continue;
				}
				else if(argv[i][0] == '-')
				{
					fail("unrecognised option '%s'", argv[i]);
				}
				else
				{
					filenames.push_back(argv[i]);
				}
			}
		}

		if(filenames.empty())
			fail("no inputs");

		auto mode = config::getMode();
		if(mode == config::Mode::Rename && config::getRules().empty())
		{
			fail("no rules given (see '%s')", ARG_HELP);
		}
		else if(mode != config::Mode::Rename && !config::getRules().empty())
		{
			util::warn("ignoring rename rules (not renaming)");
		}

		if(mode == config::Mode::Rename && config::isDryRun() && config::shouldConfirmKeep())
		{
			util::warn("'%s' has no effect with '%s'", ARG_CONFIRM_KEEP, ARG_DRY_RUN);
			config::setShouldConfirmKeep(false);
		}

		if(auto path = config::getSaveRulesPath(); !path.empty())
		{
			if(config::getRules().empty())
				fail("no rules to save");

			if(!rules::writeRuleFile(path, config::getRules()))
				fail("could not write rules to '%s'", path);

			util::info("saved %d %s to '%s'", config::getRules().size(), util::plural("rule", config::getRules().size()),
				path);
		}

		return filenames;
	}
}
