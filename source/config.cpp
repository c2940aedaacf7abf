// config.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <tuple>

#include "defs.h"

#include "picojson.h"

namespace pj = picojson;

namespace config
{
	std::fs::path getConfigFolder()
	{
		if(auto xdg = util::getEnvironmentVar("XDG_CONFIG_HOME"); !xdg.empty())
			return std::fs::path(xdg) / "renaminator";

		auto home = util::getEnvironmentVar("HOME");
		if(!home.empty())
			return std::fs::path(home) / ".config" / "renaminator";

		return std::fs::path(".renaminator");
	}

	static std::fs::path getDefaultConfigPath()
	{
		auto x = getConfigFolder() / "config.json";
		if(std::fs::exists(x))
			return x;

		if(std::fs::exists("renaminator-config.json"))
			return std::fs::path("renaminator-config.json");

		if(std::fs::exists(".renaminator-config.json"))
			return std::fs::path(".renaminator-config.json");

		return "";
	}

	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		util::error(fmt, args...);
	}

	bool readConfigFile(const std::fs::path& path)
	{
		// read it.
		uint8_t* buf = 0; size_t sz = 0;
		std::tie(buf, sz) = util::readEntireFile(path.string());
		if(!buf || sz == 0)
		{
			error("failed to read config file '%s'", path.string());
			delete[] buf;
			return false;
		}

		defer(delete[] buf);

		pj::value config;

		auto begin = buf;
		auto end = buf + sz;
		std::string err;
		pj::parse(config, begin, end, &err);
		if(!err.empty())
		{
			error("%s: %s", path.string(), err);
			return false;
		}

		// the top-level object should be "options".
		if(!config.is<pj::object>() || !config.contains("options") || !config.get("options").is<pj::object>())
		{
			error("%s: no top-level 'options' object", path.string());
			return false;
		}

		auto opts = config.get("options").get<pj::object>();

		auto get_string = [&opts](const std::string& key, const std::string& def) -> std::string {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<std::string>())
					return it->second.get<std::string>();

				else
					error("expected string value for '%s'", key);
			}

			return def;
		};

		auto get_bool = [&opts](const std::string& key, bool def) -> bool {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<bool>())
					return it->second.get<bool>();

				else
					error("expected boolean value for '%s'", key);
			}

			return def;
		};

		if(auto x = get_string("backup-folder", ""); !x.empty())
			setBackupFolder(x);

		if(auto x = get_string("operation-log", ""); !x.empty())
			setOperationLog(x);

		// these are simply the default values without a config file.
		// some are true and some are false, because of the way the boolean is
		// named -- eg. in code we have disableProgress (negative), but in
		// the config it's "show-progress" (positive).

		if(auto it = opts.find("poll-interval-ms"); it != opts.end())
		{
			if(it->second.is<double>() && it->second.get<double>() >= 1)
				setPollInterval(static_cast<int>(it->second.get<double>()));

			else
				error("expected a positive number of milliseconds for 'poll-interval-ms'");
		}

		setDisableProgress(!get_bool("show-progress", !disableProgress()));
		setIsDryRun(get_bool("dry-run", isDryRun()));
		setIsBackupEnabled(get_bool("backup-enabled", isBackupEnabled()));
		setShouldStopOnError(get_bool("stop-on-first-error", shouldStopOnError()));
		setShouldSkipHidden(get_bool("skip-hidden", shouldSkipHidden()));
		setShouldKeepExtension(get_bool("keep-extension", shouldKeepExtension()));
		setShouldConfirmKeep(get_bool("confirm-keep", shouldConfirmKeep()));
		setShouldCreateSubfolder(get_bool("create-subfolder", shouldCreateSubfolder()));
		setShouldDeleteArchives(get_bool("delete-archives-after-extract", shouldDeleteArchives()));

		return true;
	}

	void readConfig()
	{
		// if there's a manual one, use that.
		std::fs::path path;
		if(auto cp = getConfigPath(); !cp.empty())
		{
			path = cp;
			if(!std::fs::exists(path))
			{
				util::error("specified configuration file '%s' does not exist", cp);
				return;
			}
		}
		else
		{
			path = getDefaultConfigPath();
		}

		// it's ok not to have one.
		if(!path.empty())
			readConfigFile(path);
	}





	static std::string configPath;
	static std::string backupFolder;
	static std::string operationLog;
	static std::string saveRulesPath;
	static std::string videoQuality;
	static std::string subtitlePath;
	static std::string moveDestination;

	static int pollInterval = 1000;

	static std::vector<rules::Rule> ruleList;
	static Mode mode = Mode::Rename;

	static bool dryrun = false;
	static bool noprogress = false;
	static bool backupEnabled = true;
	static bool stopOnError = false;
	static bool skipHidden = false;
	static bool keepExtension = false;
	static bool confirmKeep = false;
	static bool createSubfolder = false;
	static bool deleteArchives = false;

	Options current()
	{
		Options ret;
		ret.deleteArchivesAfterExtract = deleteArchives;
		ret.showProgress = !noprogress;
		ret.createSubfolder = createSubfolder;
		ret.backupEnabled = backupEnabled;
		ret.dryRun = dryrun;

		ret.stopOnError = stopOnError;
		ret.skipHidden = skipHidden;
		ret.keepExtension = keepExtension;
		ret.confirmKeep = confirmKeep;

		ret.backupFolder = backupFolder;
		ret.operationLog = getOperationLog();

		ret.pollIntervalMs = pollInterval;

		return ret;
	}

	std::vector<rules::Rule> getRules()     { return ruleList; }
	Mode getMode()                          { return mode; }

	std::string getConfigPath()             { return configPath; }
	std::string getBackupFolder()           { return backupFolder; }
	std::string getSaveRulesPath()          { return saveRulesPath; }
	std::string getVideoQuality()           { return videoQuality; }
	std::string getSubtitlePath()           { return subtitlePath; }
	std::string getMoveDestination()        { return moveDestination; }
	int getPollInterval()                   { return pollInterval; }
	bool isDryRun()                         { return dryrun; }
	bool disableProgress()                  { return noprogress; }
	bool isBackupEnabled()                  { return backupEnabled; }
	bool shouldStopOnError()                { return stopOnError; }
	bool shouldSkipHidden()                 { return skipHidden; }
	bool shouldKeepExtension()              { return keepExtension; }
	bool shouldConfirmKeep()                { return confirmKeep; }
	bool shouldCreateSubfolder()            { return createSubfolder; }
	bool shouldDeleteArchives()             { return deleteArchives; }

	std::string getOperationLog()
	{
		if(!operationLog.empty())
			return operationLog;

		return (getConfigFolder() / "operations.log").string();
	}

	void addRule(const rules::Rule& rule)           { ruleList.push_back(rule); }
	void setMode(Mode x)                            { mode = x; }

	void setBackupFolder(const std::string& x)      { backupFolder = x; }
	void setOperationLog(const std::string& x)      { operationLog = x; }
	void setSaveRulesPath(const std::string& x)     { saveRulesPath = x; }
	void setVideoQuality(const std::string& x)      { videoQuality = x; }
	void setSubtitlePath(const std::string& x)      { subtitlePath = x; }
	void setMoveDestination(const std::string& x)   { moveDestination = x; }
	void setPollInterval(int ms)                    { pollInterval = ms; }
	void setIsDryRun(bool x)                        { dryrun = x; }
	void setDisableProgress(bool x)                 { noprogress = x; }
	void setIsBackupEnabled(bool x)                 { backupEnabled = x; }
	void setShouldStopOnError(bool x)               { stopOnError = x; }
	void setShouldSkipHidden(bool x)                { skipHidden = x; }
	void setShouldKeepExtension(bool x)             { keepExtension = x; }
	void setShouldConfirmKeep(bool x)               { confirmKeep = x; }
	void setShouldCreateSubfolder(bool x)           { createSubfolder = x; }
	void setShouldDeleteArchives(bool x)            { deleteArchives = x; }

	void setConfigPath(const std::string& x)
	{
		// this one is special. once we set it, we wanna re-read the config.
		configPath = x;
		readConfig();
	}
}
