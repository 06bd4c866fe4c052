//
// Created by nova on 3/10/21.
//

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "Credentials.h"
#include "../utils/Utils.h"

Json::Value Acme::AccountCredentials::toJson() const
{
	Json::Value json;
	json["uri"] = uri;
	json["key"] = key;
	return json;
}

Acme::AccountCredentials Acme::AccountCredentials::FromJson(const Json::Value& json)
{
	if (!json.isObject())
		throw PersistenceError("credentials document is not a json object");
	else if (!json["uri"].isString() or json["uri"].asString().empty())
		throw PersistenceError("property 'uri' of credentials document not found");
	else if (!json["key"].isString() or json["key"].asString().empty())
		throw PersistenceError("property 'key' of credentials document not found");

	AccountCredentials credentials;
	credentials.uri = json["uri"].asString();
	credentials.key = json["key"].asString();
	return credentials;
}

bool Acme::Credentials::ParseFormat(const std::string& name, Format* format)
{
	std::string lowerCase = Utils::StringProcess::ToLowerCase(name);
	if (lowerCase == "json")
		*format = Format::Json;
	else if (lowerCase == "key")
		*format = Format::KeyOnly;
	else
		return false;
	return true;
}

std::string Acme::Credentials::Render(const AccountCredentials& credentials, Format format)
{
	if (format == Format::KeyOnly)
		return credentials.key;
	return Utils::StringProcess::JsonToCompactString(credentials.toJson());
}

static std::string DirectoryOf(const std::string& path)
{
	auto pos = path.find_last_of('/');
	if (pos == std::string::npos)
		return ".";
	else if (pos == 0)
		return "/";
	return path.substr(0, pos);
}

static void WriteAll(int fd, const std::string& data, const std::string& tmpPath)
{
	size_t written = 0;
	while (written < data.size())
	{
		ssize_t ret = write(fd, data.data() + written, data.size() - written);
		if (ret < 0)
		{
			if (errno == EINTR)
				continue;
			throw Acme::PersistenceError("cannot write " + tmpPath, std::strerror(errno));
		}
		written += (size_t)ret;
	}
}

void Acme::Credentials::WriteFile(const AccountCredentials& credentials, const std::string& path, Format format)
{
	if (path.empty())
		throw PersistenceError("output path is empty");
	if (credentials.uri.empty() and format == Format::Json)
		throw PersistenceError("refusing to write credentials without an account url");
	if (credentials.key.empty())
		throw PersistenceError("refusing to write credentials without a key");

	std::string dir = DirectoryOf(path);
	if (access(dir.c_str(), W_OK) != 0)
		throw PersistenceError("output directory " + dir + " is not writable", std::strerror(errno));

	/* mkstemp() creates the file with mode 0600 */
	std::string tmpPath = path + ".XXXXXX";
	std::vector<char> tmpTemplate(tmpPath.begin(), tmpPath.end());
	tmpTemplate.push_back('\0');
	int fd = mkstemp(tmpTemplate.data());
	if (fd < 0)
		throw PersistenceError("cannot create temporary file next to " + path, std::strerror(errno));
	tmpPath = tmpTemplate.data();

	try
	{
		if (fchmod(fd, S_IRUSR | S_IWUSR) != 0)
			throw PersistenceError("cannot set permissions of " + tmpPath, std::strerror(errno));
		WriteAll(fd, Render(credentials, format), tmpPath);
		if (fsync(fd) != 0)
			throw PersistenceError("cannot flush " + tmpPath, std::strerror(errno));
	}
	catch (PersistenceError&)
	{
		close(fd);
		unlink(tmpPath.c_str());
		throw;
	}

	if (close(fd) != 0)
	{
		int closeErrno = errno;
		unlink(tmpPath.c_str());
		throw PersistenceError("cannot close " + tmpPath, std::strerror(closeErrno));
	}
	if (rename(tmpPath.c_str(), path.c_str()) != 0)
	{
		int renameErrno = errno;
		unlink(tmpPath.c_str());
		throw PersistenceError("cannot move credentials to " + path, std::strerror(renameErrno));
	}
}

Acme::AccountCredentials Acme::Credentials::ReadFile(const std::string& path)
{
	if (access(path.c_str(), R_OK) != 0)
		throw PersistenceError("credentials file " + path + " is not readable", std::strerror(errno));

	std::ifstream in(path);
	std::string jsonString((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	if (in.bad())
		throw PersistenceError("cannot read credentials file " + path);

	Json::Value json;
	std::string errors = Utils::StringProcess::StringToJson(jsonString, &json);
	if (!errors.empty())
		throw PersistenceError("credentials file " + path + " is not valid json", errors);
	return AccountCredentials::FromJson(json);
}
