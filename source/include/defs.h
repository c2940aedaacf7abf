// defs.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>

#include "zpr.h"

#define COLOUR_RESET			"\033[0m"
#define COLOUR_BLACK			"\033[30m"			// Black
#define COLOUR_RED				"\033[31m"			// Red
#define COLOUR_GREEN			"\033[32m"			// Green
#define COLOUR_YELLOW			"\033[33m"			// Yellow
#define COLOUR_BLUE				"\033[34m"			// Blue
#define COLOUR_MAGENTA			"\033[35m"			// Magenta
#define COLOUR_CYAN				"\033[36m"			// Cyan
#define COLOUR_WHITE			"\033[37m"			// White
#define COLOUR_BLACK_BOLD		"\033[1m"			// Bold Black
#define COLOUR_RED_BOLD			"\033[1m\033[31m"	// Bold Red
#define COLOUR_GREEN_BOLD		"\033[1m\033[32m"	// Bold Green
#define COLOUR_YELLOW_BOLD		"\033[1m\033[33m"	// Bold Yellow
#define COLOUR_BLUE_BOLD		"\033[1m\033[34m"	// Bold Blue
#define COLOUR_MAGENTA_BOLD		"\033[1m\033[35m"	// Bold Magenta
#define COLOUR_CYAN_BOLD		"\033[1m\033[36m"	// Bold Cyan
#define COLOUR_WHITE_BOLD		"\033[1m\033[37m"	// Bold White
#define COLOUR_GREY_BOLD		"\033[30;1m"		// Bold Grey


namespace std
{
	namespace fs = filesystem;
}

namespace util
{
	void indent_log(int n = 1);
	void unindent_log(int n = 1);

	int get_log_indent();

	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			fprintf(stderr, "  ");

		fprintf(stderr, " %s*%s %s\n", COLOUR_RED_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void log(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_GREEN_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void info(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_BLUE_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void warn(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_YELLOW_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	// appends '[YYYY-mm-dd HH:MM:SS] msg' to the log at 'path'; an empty path means no log.
	void logOperation(const std::string& path, const std::string& msg);

	// redraws the current line on stderr; finishProgress() moves past it.
	void printProgress(double percent, const std::string& msg);
	void finishProgress();


	size_t getTerminalWidth();

	size_t getFileSize(const std::string& path);
	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path);
	bool writeEntireFile(const std::string& path, const std::string& contents);

	static inline std::vector<std::string> splitString(std::string view, char delim = '\n')
	{
		std::vector<std::string> ret;

		while(true)
		{
			size_t ln = view.find(delim);

			if(ln != std::string_view::npos)
			{
				ret.emplace_back(view.data(), ln);
				view = view.substr(ln + 1);
			}
			else
			{
				break;
			}
		}

		// account for the case when there's no trailing newline, and we still have some stuff stuck in the view.
		if(!view.empty())
			ret.emplace_back(view.data(), view.length());

		return ret;
	}

	static inline std::string trim(const std::string& s)
	{
		auto ltrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_first_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s.remove_prefix(i);

			return s;
		};

		auto rtrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_last_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s = s.substr(0, i + 1);

			return s;
		};

		std::string_view sv = s;
		return std::string(ltrim(rtrim(sv)));
	}

	static inline std::string lowercase(std::string xs)
	{
		for(size_t i = 0; i < xs.size(); i++)
			xs[i] = tolower(static_cast<unsigned char>(xs[i]));

		return xs;
	}

	static inline std::string plural(const std::string& s, size_t n)
	{
		return n == 1 ? s : s + "s";
	}

	// the manifest and rule files are '|'-delimited; escape the delimiter, backslashes and newlines.
	std::string escapeField(const std::string& s);
	std::vector<std::string> splitEscaped(const std::string& line, char delim = '|');

	// 01:03:14.51
	std::string uglyPrintTime(uint64_t ns, bool ms = true);

	// strftime() of the local time.
	std::string currentTimestamp(const char* fmt);

	std::string getEnvironmentVar(const std::string& name);

	// wraps the string in single quotes for /bin/sh.
	std::string shellQuote(const std::string& s);

	// searches $PATH; returns an empty path if the program isn't there.
	std::fs::path findProgram(const std::string& name);

	// true if 'path' is 'base' or somewhere below it. both should be absolute.
	bool isWithin(const std::fs::path& path, const std::fs::path& base);
}

enum class ErrorKind
{
	None,

	InaccessibleRoot,
	UnreadableObject,
	InvalidPattern,
	InvalidTargetName,
	NameCollision,
	RenameFailed,
	ManifestWriteFailure,
	InvalidManifest,
	UnresolvableRestoreEntry,

	MissingDependency,
	ToolFailed,
	Cancelled,
};

const char* errorKindName(ErrorKind kind);

namespace rules
{
	enum class Kind
	{
		Literal,
		Regex,
		SmartSpace,
		DigitSpace,
	};

	struct Rule
	{
		std::string match;
		std::string replacement;

		Kind kind = Kind::Literal;
		bool caseSensitive = true;
	};

	std::string kindName(Kind kind);
	std::optional<Kind> parseKind(const std::string& s);

	std::string replaceLiteral(const std::string& input, const std::string& match, const std::string& replacement,
		bool caseSensitive);

	// inserts a space at every digit/non-digit and lower/upper boundary.
	std::string smartSpace(const std::string& input);

	// inserts a space at every digit/letter boundary.
	std::string digitSpace(const std::string& input);

	// 'match|replacement|kind|case_sensitive', one per line.
	std::vector<Rule> parseRules(const std::string& text, std::vector<std::string>* errors = nullptr);
	std::string serialiseRules(const std::vector<Rule>& rules);

	bool readRuleFile(const std::fs::path& path, std::vector<Rule>& out);
	bool writeRuleFile(const std::fs::path& path, const std::vector<Rule>& rules);
}

namespace config
{
	struct Options
	{
		bool deleteArchivesAfterExtract = false;
		bool showProgress = true;
		bool createSubfolder = false;
		bool backupEnabled = true;
		bool dryRun = false;

		bool stopOnError = false;
		bool skipHidden = false;
		bool keepExtension = false;
		bool confirmKeep = false;

		std::string backupFolder;
		std::string operationLog;

		int pollIntervalMs = 1000;
	};

	enum class Mode
	{
		Rename,
		Backup,
		Restore,
		Extract,
		Compress,
		Subtitles,
		Photos,
		Move,
	};

	void readConfig();
	bool readConfigFile(const std::fs::path& path);

	// a snapshot of the current settings, handed to each operation.
	Options current();

	std::fs::path getConfigFolder();

	std::string getConfigPath();
	std::string getBackupFolder();
	std::string getOperationLog();
	std::string getSaveRulesPath();
	std::string getVideoQuality();
	std::string getSubtitlePath();
	std::string getMoveDestination();
	int getPollInterval();

	std::vector<rules::Rule> getRules();
	Mode getMode();

	bool isDryRun();
	bool disableProgress();
	bool isBackupEnabled();
	bool shouldStopOnError();
	bool shouldSkipHidden();
	bool shouldKeepExtension();
	bool shouldConfirmKeep();
	bool shouldCreateSubfolder();
	bool shouldDeleteArchives();

	void addRule(const rules::Rule& rule);
	void setMode(Mode x);

	void setConfigPath(const std::string& x);
	void setBackupFolder(const std::string& x);
	void setOperationLog(const std::string& x);
	void setSaveRulesPath(const std::string& x);
	void setVideoQuality(const std::string& x);
	void setSubtitlePath(const std::string& x);
	void setMoveDestination(const std::string& x);
	void setPollInterval(int ms);

	void setIsDryRun(bool x);
	void setDisableProgress(bool x);
	void setIsBackupEnabled(bool x);
	void setShouldStopOnError(bool x);
	void setShouldSkipHidden(bool x);
	void setShouldKeepExtension(bool x);
	void setShouldConfirmKeep(bool x);
	void setShouldCreateSubfolder(bool x);
	void setShouldDeleteArchives(bool x);
}

namespace args
{
	std::vector<std::string> parseCmdLineOpts(int argc, char** argv);
}

// (percent, message). percent is negative when it can't be estimated.
using ProgressFn = std::function<void (double, const std::string&)>;

namespace renamer
{
	enum class Status
	{
		Renamed,
		WouldRename,
		Unchanged,
		Failed,
	};

	struct FileResult
	{
		std::fs::path original;
		std::fs::path target;

		Status status = Status::Unchanged;
		ErrorKind error = ErrorKind::None;
		std::string message;
	};

	struct Outcome
	{
		ErrorKind fatal = ErrorKind::None;
		std::string message;

		bool dryRun = false;

		size_t totalCandidates = 0;
		size_t renamedCount = 0;
		size_t errorCount = 0;

		std::vector<FileResult> files;
	};

	// returns the folded name, or nothing if a rule failed (with the reason in 'err').
	std::optional<std::string> foldName(const std::string& name, const std::vector<rules::Rule>& rules,
		bool keepExtension, std::string* err = nullptr);

	std::vector<std::fs::path> collectFiles(const std::fs::path& root, bool skipHidden);

	Outcome applyRules(const std::fs::path& root, const std::vector<rules::Rule>& rules, const config::Options& opts,
		const ProgressFn& progress = nullptr);
}

namespace mover
{
	enum class Kind
	{
		// images at any depth; emptied folders are removed at any depth.
		Photos,

		// every file at most MOVE_DEPTH levels down; emptied folders are removed down to the same depth.
		AllFiles,
	};

	constexpr int MOVE_DEPTH = 3;

	enum class Status
	{
		Moved,
		WouldMove,
		Failed,
	};

	struct FileResult
	{
		std::fs::path original;
		std::fs::path target;

		Status status = Status::Failed;
		ErrorKind error = ErrorKind::None;
		std::string message;
	};

	struct Outcome
	{
		ErrorKind fatal = ErrorKind::None;
		std::string message;

		bool dryRun = false;

		size_t totalCandidates = 0;
		size_t movedCount = 0;
		size_t errorCount = 0;

		std::vector<FileResult> files;

		// deepest first. in a dry run, the folders that would be removed.
		std::vector<std::fs::path> removedFolders;
	};

	// jpg, jpeg, png, gif, bmp, tiff or webp, in any case.
	bool isImage(const std::fs::path& path);

	// sorted. 'maxDepth' of 1 means only files directly inside 'source'; 0 means no limit.
	std::vector<std::fs::path> collectFiles(const std::fs::path& source, bool imagesOnly, int maxDepth,
		bool skipHidden);

	// moves everything into 'dest' (flattened), then removes the folders that were left empty.
	Outcome moveFiles(const std::fs::path& source, const std::fs::path& dest, Kind kind, const config::Options& opts,
		const ProgressFn& progress = nullptr);
}

namespace backup
{
	enum class ObjectType
	{
		File,
		Directory,
		Other,
	};

	struct Entry
	{
		std::string absolutePath;
		std::string relativePath;

		ObjectType type = ObjectType::Other;
		uint32_t permissions = 0;
		uint64_t sizeBytes = 0;

		// nanoseconds since the epoch
		int64_t modifiedAt = 0;

		// hex sha256 (or md5, in old manifests); empty for anything that isn't a readable regular file.
		std::string checksum;
	};

	struct Manifest
	{
		int version = 1;
		std::string created;
		std::string root;

		std::vector<Entry> entries;
	};

	struct Result
	{
		ErrorKind error = ErrorKind::None;
		std::string message;

		std::fs::path manifestPath;
		size_t entryCount = 0;

		std::vector<std::string> unreadable;

		bool ok() const { return this->error == ErrorKind::None; }
	};

	std::string serialiseManifest(const Manifest& manifest);
	bool parseManifest(const std::string& text, Manifest& out, std::string* err = nullptr);

	enum class Digest
	{
		Sha256,
		Md5,
	};

	// picks the digest from the length of the hex string; manifests from the old shell scripts used md5sum.
	std::optional<Digest> digestForChecksum(const std::string& hex);

	// empty string if the file couldn't be read.
	std::string checksumFile(const std::fs::path& path, Digest digest = Digest::Sha256);

	// captures the tree in deletion-safe order (children before their parent, the root last).
	std::vector<Entry> captureTree(const std::fs::path& root, std::vector<std::string>* unreadable = nullptr);

	std::fs::path defaultBackupFolder();

	Result createBackup(const std::fs::path& root, const config::Options& opts);
}

namespace restore
{
	enum class Action
	{
		Present,
		Recreated,
		Renamed,
		WouldRecreate,
		WouldRename,
		Unresolvable,
	};

	struct EntryResult
	{
		std::string path;
		std::string currentPath;

		Action action = Action::Present;
		ErrorKind error = ErrorKind::None;
		std::string message;
	};

	struct Outcome
	{
		ErrorKind fatal = ErrorKind::None;
		std::string message;

		size_t restoredCount = 0;
		size_t unresolvedCount = 0;

		std::vector<EntryResult> entries;
	};

	std::fs::path consumedMarker(const std::fs::path& manifestPath);

	Outcome restore(const std::fs::path& manifestPath, const config::Options& opts);
}

namespace proc
{
	struct CancelToken
	{
		std::atomic<bool> cancelled { false };

		void cancel()           { this->cancelled = true; }
		bool isCancelled() const { return this->cancelled; }
	};

	struct Result
	{
		ErrorKind error = ErrorKind::None;
		int status = -1;

		std::string out;
		std::string err;

		bool ok() const { return this->error == ErrorKind::None; }
	};

	struct Job
	{
		std::string cmdline;

		// called between polls; return a progress value (or a negative one) to report.
		std::function<std::pair<double, std::string> ()> poll;

		// deleted if the job is cancelled or fails.
		std::vector<std::fs::path> partialOutputs;

		// always deleted once the job is over.
		std::vector<std::fs::path> tempFiles;
	};

	// waits for the program to exit and captures its output.
	Result run(const std::string& cmdline);

	Result supervise(const Job& job, const config::Options& opts, CancelToken& cancel,
		const ProgressFn& progress = nullptr);

	bool checkDependencies(const std::vector<std::string>& programs);
}

namespace extract
{
	enum class ArchiveKind
	{
		None,
		Rar,
		Zip,
		SevenZip,
		TarGz,
		TarBz2,
		TarXz,
	};

	ArchiveKind detectArchive(const std::fs::path& path);

	// name of the archive minus its archive suffix(es); "foo.tar.gz" -> "foo".
	std::string archiveStem(const std::fs::path& path);

	const char* requiredProgram(ArchiveKind kind);
	std::string buildCommand(ArchiveKind kind, const std::fs::path& archive, const std::fs::path& dest);

	bool extractArchive(const std::fs::path& archive, const config::Options& opts, proc::CancelToken& cancel,
		const ProgressFn& progress = nullptr);
}

namespace video
{
	enum class Operation
	{
		Compress,
		Subtitles,
	};

	struct Quality
	{
		std::string preset;
		int crf = 23;
	};

	std::optional<Quality> parseQuality(const std::string& name);
	std::fs::path outputPath(const std::fs::path& input);

	std::string buildCompressCommand(const std::fs::path& input, const std::fs::path& output,
		const Quality& quality, const std::fs::path& progressFile, int threads);

	std::string buildSubtitleCommand(const std::fs::path& input, const std::fs::path& subtitle,
		const std::fs::path& output, const std::fs::path& progressFile);

	// seconds of output written so far, from ffmpeg's '-progress' output; negative if none yet.
	double parseProgressSeconds(const std::string& text);

	// mediainfo reports milliseconds; negative if it's not a number.
	double parseDurationMs(const std::string& text);

	double estimatePercent(double elapsed, double duration);

	bool processVideo(const std::fs::path& input, Operation op, const std::string& argument,
		const config::Options& opts, proc::CancelToken& cancel, const ProgressFn& progress = nullptr);
}

namespace driver
{
	std::vector<std::fs::path> collectInputs(const std::vector<std::string>& inputs, config::Mode mode);

	bool processOneInput(const std::fs::path& input, proc::CancelToken& cancel);
}

namespace misc
{
	// y/n prompt on stdin; an empty answer picks the default.
	bool confirm(const std::string& question, bool def);
}






// defer implementation
// credit: gingerBill
// shamelessly stolen from https://github.com/gingerBill/gb


namespace __dontlook
{
	// NOTE(bill): Stupid fucking templates
	template <typename T> struct gbRemoveReference       { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &>  { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &&> { typedef T Type; };

	/// NOTE(bill): "Move" semantics - invented because the C++ committee are idiots (as a collective not as indiviuals (well a least some aren't))
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &t)  { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &&t) { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_move   (T &&t)                                   { return static_cast<typename gbRemoveReference<T>::Type &&>(t); }
	template <typename F>
	struct gbprivDefer {
		F f;
		gbprivDefer(F &&f) : f(gb_forward<F>(f)) {}
		~gbprivDefer() { f(); }
	};
	template <typename F> gbprivDefer<F> gb__defer_func(F &&f) { return gbprivDefer<F>(gb_forward<F>(f)); }
}

#define GB_DEFER_1(x, y) x##y
#define GB_DEFER_2(x, y) GB_DEFER_1(x, y)
#define GB_DEFER_3(x)    GB_DEFER_2(x, __COUNTER__)
#define defer(code) auto GB_DEFER_3(_defer_) = __dontlook::gb__defer_func([&]()->void{code;})
