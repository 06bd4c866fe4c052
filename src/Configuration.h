//
// Created by nova on 8/12/20.
//

#ifndef ACMEREG_CONFIGURATION_H
#define ACMEREG_CONFIGURATION_H

#include <string>
#include <fstream>
#include <memory>
#include <unistd.h>
#include <json/json.h>
#include "utils/Utils.h"
#include "acme/Acme.h"

#define DEFAULT_CA "letsencrypt"
#define DEFAULT_OUTPUT_PATH "account_credentials.json"
#define DEFAULT_OUTPUT_FORMAT "json"

class Configuration
{
public:
	/* An empty 'configPath' means no config file, 'overrides' alone describe the run.
	 * Exceptions: ConfigurationException() */
	explicit Configuration(std::string configPath, Json::Value overrides = Json::Value(Json::objectValue)) :
							configFilePath(std::move(configPath)), overrides(std::move(overrides)) { load(); }
	~Configuration() = default;
	const Json::Value& getJson();

	/* Members of 'source' replace those of 'target', objects are merged recursively */
	static void Merge(Json::Value& target, const Json::Value& source);

private:
	void load();
	void applyDefaults();
	std::string configFilePath;
	Json::Value overrides;
	Json::Value configs;

	/* Functions below are property checker, indentation represents the call level. */
	void checkConfigs();
	void propertyLog();
		static void propertyLogDir(const Json::Value& log);
	void propertyAcme();
		static void propertyAcmeMailto(const Json::Value& acme);
		static void propertyAcmeCA(const Json::Value& acme);
		static void propertyAcmeDirectoryurl(const Json::Value& acme);
		static void propertyAcmeTermsofserviceagreed(const Json::Value& acme);
		static void propertyAcmeTimeout(const Json::Value& acme);
		static void propertyAcmeCacertpath(const Json::Value& acme);
	void propertyOutput();
		static void propertyOutputPath(const Json::Value& output);
		static void propertyOutputFormat(const Json::Value& output);
};

class ConfigurationException : public std::exception
{
public:
	explicit ConfigurationException(std::string str) : message(std::move(str)) {}
	~ConfigurationException() noexcept override = default;
	[[nodiscard]] const char* what() const noexcept override { return message.c_str(); }

private:
	std::string message;
};

#endif //ACMEREG_CONFIGURATION_H
