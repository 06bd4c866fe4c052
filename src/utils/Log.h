//
// Created by nova on 8/5/20.
//

#ifndef ACMEREG_LOG_H
#define ACMEREG_LOG_H

#include <ctime>
#include <cstdio>
#include <json/json.h>
#include <easylogging++.h>
#include "Utils.h"

static const std::string logFileName = "acmereg.log";

inline void PreRollOutCallback(const char* fullPath, std::size_t s)
{
	auto utcZone = Utils::Time::localTimeZoneUTC();
	auto newName = std::string(fullPath) + "." + Utils::Time::UnixTimeToRFC3339(std::time(nullptr), utcZone);
	rename(fullPath, newName.c_str());
}

/* Logs always go to stdout, and to 'log.dir'/acmereg.log when 'log.dir' is set */
inline void SetupEasylogger(const Json::Value& configs)
{
	el::Configurations loggerConf;      /* Logger configuration */
	el::Helpers::installPreRollOutCallback(PreRollOutCallback);
	el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
	loggerConf.setToDefault();
#ifndef NDEBUG
	loggerConf.set(el::Level::Global, el::ConfigurationType::Format,
	               "%datetime [%level] (%fbase:%line) %msg");       /* Set log format */
#else
	loggerConf.set(el::Level::Global, el::ConfigurationType::Format,
	               "%datetime [%level] %msg");       /* Set log format */
#endif
	loggerConf.set(el::Level::Global, el::ConfigurationType::ToStandardOutput, "true"); /* Set log to stdout */
	if (configs["log"]["dir"].isString() and !configs["log"]["dir"].asString().empty())
	{
		loggerConf.set(el::Level::Global, el::ConfigurationType::MaxLogFileSize, "4194304");  /* 4 MiB */
		loggerConf.set(el::Level::Global, el::ConfigurationType::ToFile, "true");   /* Set log to file */
		loggerConf.set(el::Level::Global, el::ConfigurationType::Filename,
		               configs["log"]["dir"].asString() + "/" + logFileName);     /* Set log file path */
	}
	else
		loggerConf.set(el::Level::Global, el::ConfigurationType::ToFile, "false");
	el::Loggers::reconfigureAllLoggers(loggerConf);      /* Apply configuration to all loggers */
}

#endif //ACMEREG_LOG_H
