//
// Created by nova on 8/12/20.
//

#include "Configuration.h"

const Json::Value& Configuration::getJson()
{
	return configs;
}

void Configuration::Merge(Json::Value& target, const Json::Value& source)
{
	if (!source.isObject())
		return;
	for (const auto& name : source.getMemberNames())
	{
		if (source[name].isObject() and target[name].isObject())
			Merge(target[name], source[name]);
		else
			target[name] = source[name];
	}
}

void Configuration::load()
{
	configs = Json::Value(Json::objectValue);
	if (!configFilePath.empty())
	{
		// Check if json file exists
		if (access(configFilePath.c_str(), R_OK) == -1)
			throw ConfigurationException("config file inaccessible.");

		// Read string from file
		std::ifstream in(configFilePath);
		std::string jsonString((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

		// Parse string to json
		std::string errs = Utils::StringProcess::StringToJson(jsonString, &configs);
		if (!errs.empty())
			throw ConfigurationException("Errors in config file:\n" + errs);
		else if (!configs.isObject())
			throw ConfigurationException("config file must contain a json object.");
	}

	// Command line wins over the file
	Merge(configs, overrides);
	applyDefaults();

	// Check configurations
	checkConfigs();
}

void Configuration::applyDefaults()
{
	if (configs["acme"].isNull())
		configs["acme"] = Json::Value(Json::objectValue);
	if (configs["output"].isNull())
		configs["output"] = Json::Value(Json::objectValue);

	Json::Value& acme = configs["acme"];
	if (acme.isObject() and acme["ca"].isNull() and acme["directory_url"].isNull())
		acme["ca"] = DEFAULT_CA;
	if (acme.isObject() and acme["terms_of_service_agreed"].isNull())
		acme["terms_of_service_agreed"] = true;

	Json::Value& output = configs["output"];
	if (output.isObject() and output["path"].isNull())
		output["path"] = DEFAULT_OUTPUT_PATH;
	if (output.isObject() and output["format"].isNull())
		output["format"] = DEFAULT_OUTPUT_FORMAT;
}

void Configuration::checkConfigs()
{
	propertyLog();
	propertyAcme();
	propertyOutput();
}

void Configuration::propertyLog()
{
	if (configs["log"].isNull())
		return;
	else if (!configs["log"].isObject())
		throw ConfigurationException("value of 'log' must be an object.");
	else
		propertyLogDir(configs["log"]);
}

void Configuration::propertyLogDir(const Json::Value& log)
{
	if (log["dir"].isNull())
		return;

	else if (!log["dir"].isString())
		throw ConfigurationException("value of 'log.dir' must be a string.");

	else if (access(log["dir"].asCString(), R_OK) == -1 ||
	         access(log["dir"].asCString(), W_OK)) /* Check if property 'log.dir' readable and writable */
		throw ConfigurationException("value of 'log.dir', the location of log files is inaccessible.");
}

void Configuration::propertyAcme()
{
	if (!configs["acme"].isObject())
		throw ConfigurationException("value of 'acme' must be an object.");
	else
	{
		propertyAcmeMailto(configs["acme"]);
		propertyAcmeCA(configs["acme"]);
		propertyAcmeDirectoryurl(configs["acme"]);
		propertyAcmeTermsofserviceagreed(configs["acme"]);
		propertyAcmeTimeout(configs["acme"]);
		propertyAcmeCacertpath(configs["acme"]);
	}
}

void Configuration::propertyAcmeMailto(const Json::Value& acme)
{
	if (acme["mailto"].isNull())
		throw ConfigurationException("property 'acme.mailto' not found, use option '--email' or '-e'.");

	else if (!acme["mailto"].isString())
		throw ConfigurationException("value of 'acme.mailto' must be a string.");

	else if (acme["mailto"].asString().empty())
		throw ConfigurationException("value of 'acme.mailto' cannot be empty.");

	else if (Utils::ParseEmailAddress(acme["mailto"].asString()).empty())
		throw ConfigurationException("value of 'acme.mailto', " + acme["mailto"].asString() + " is not a valid email.");
}

void Configuration::propertyAcmeCA(const Json::Value& acme)
{
	if (acme["ca"].isNull())
		return;

	else if (!acme["ca"].isString())
		throw ConfigurationException("value of 'acme.ca' must be a string.");

	else if (!Acme::CAIsSupported(acme["ca"].asString()))
		throw ConfigurationException("value of 'acme.ca', not supported certificate authority.");
}

void Configuration::propertyAcmeDirectoryurl(const Json::Value& acme)
{
	if (acme["directory_url"].isNull())
		return;

	else if (!acme["directory_url"].isString())
		throw ConfigurationException("value of 'acme.directory_url' must be a string.");

	else if (!Utils::URL::IsValid(acme["directory_url"].asString()))
		throw ConfigurationException("value of 'acme.directory_url', " + acme["directory_url"].asString() + " is not a valid url.");
}

void Configuration::propertyAcmeTermsofserviceagreed(const Json::Value& acme)
{
	if (!acme["terms_of_service_agreed"].isBool())
		throw ConfigurationException("value of 'acme.terms_of_service_agreed' must be a boolean.");
}

void Configuration::propertyAcmeTimeout(const Json::Value& acme)
{
	if (acme["timeout"].isNull())
		return;

	else if (!acme["timeout"].isNumeric())
		throw ConfigurationException("value of 'acme.timeout' must be a number.");

	else if (!acme["timeout"].isIntegral())
		throw ConfigurationException("value of 'acme.timeout' must be an integer.");

	else if (!acme["timeout"].isInt())
		throw ConfigurationException("value of 'acme.timeout' is out of range.");

	else if (acme["timeout"].asInt() < 1)
		throw ConfigurationException("value of 'acme.timeout', must be at least one second.");
}

void Configuration::propertyAcmeCacertpath(const Json::Value& acme)
{
	if (acme["ca_cert_path"].isNull())
		return;

	else if (!acme["ca_cert_path"].isString())
		throw ConfigurationException("value of 'acme.ca_cert_path' must be a string.");

	else if (access(acme["ca_cert_path"].asCString(), R_OK) == -1)
		throw ConfigurationException("value of 'acme.ca_cert_path', CA certificates file is inaccessible.");
}

void Configuration::propertyOutput()
{
	if (!configs["output"].isObject())
		throw ConfigurationException("value of 'output' must be an object.");
	else
	{
		propertyOutputPath(configs["output"]);
		propertyOutputFormat(configs["output"]);
	}
}

void Configuration::propertyOutputPath(const Json::Value& output)
{
	if (!output["path"].isString())
		throw ConfigurationException("value of 'output.path' must be a string.");

	else if (output["path"].asString().empty())
		throw ConfigurationException("value of 'output.path' cannot be empty.");
}

void Configuration::propertyOutputFormat(const Json::Value& output)
{
	Acme::Credentials::Format format;
	if (!output["format"].isString())
		throw ConfigurationException("value of 'output.format' must be a string.");

	else if (!Acme::Credentials::ParseFormat(output["format"].asString(), &format))
		throw ConfigurationException(R"(value of 'output.format' could only be "json" or "key".)");
}
