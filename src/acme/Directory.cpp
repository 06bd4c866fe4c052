//
// Created by nova on 3/8/21.
//

#include <regex>
#include "Directory.h"
#include "../utils/Utils.h"

const std::vector<std::string>& Acme::RequiredEndpoints()
{
	static std::vector<std::string> names
	{
		"newNonce",
		"newAccount"
	};
	return names;
}

bool Acme::Directory::has(const std::string& name) const
{
	return !endpoint(name).empty();
}

std::string Acme::Directory::endpoint(const std::string& name) const
{
	auto found = endpoints.find(name);
	return found == endpoints.end() ? std::string() : found->second;
}

Acme::Directory Acme::Directory::FromJson(const std::string& url, const Json::Value& json)
{
	if (!json.isObject())
		throw DirectoryError("directory at " + url + " is not a json object");

	Directory directory;
	directory.url = url;
	for (const auto& name : json.getMemberNames())
	{
		if (json[name].isString())
			directory.endpoints[name] = json[name].asString();
	}

	const Json::Value& meta = json["meta"];
	if (meta.isObject())
	{
		if (meta["termsOfService"].isString())
			directory.termsOfService = meta["termsOfService"].asString();
		if (meta["website"].isString())
			directory.website = meta["website"].asString();
		if (meta["caaIdentities"].isArray())
		{
			for (const auto& identity : meta["caaIdentities"])
			{
				if (identity.isString())
					directory.caaIdentities.push_back(identity.asString());
			}
		}
		directory.externalAccountRequired = meta["externalAccountRequired"].isBool() and meta["externalAccountRequired"].asBool();
	}

	for (const auto& name : RequiredEndpoints())
	{
		if (!directory.has(name))
			throw DirectoryError("directory at " + url + " has no '" + name + "' endpoint");
	}
	return directory;
}

const httplib::Headers& Acme::DirectoryClient::DefaultHeaders()
{
	static httplib::Headers headers
	{
		{"User-Agent", USER_AGENT},
		{"Accept-Language", "en"}
	};
	return headers;
}

Acme::Directory Acme::DirectoryClient::fetchDirectory(const std::string& baseUrl)
{
	/* Request */
	std::shared_ptr<httplib::Response> response;
	try
	{
		response = cli->get(baseUrl, DefaultHeaders());
	}
	catch (Utils::APIRequestException& e)
	{
		throw DirectoryError("cannot fetch directory", e.what());
	}

	if (response == nullptr)
		throw DirectoryError("cannot fetch directory", baseUrl + " did not respond");
	else if (response->status != 200)
		throw DirectoryError("cannot fetch directory", baseUrl + " returns http code " + std::to_string(response->status) +
		                                               ": " + std::regex_replace(response->body, std::regex("\n"), ""));

	Json::Value jsonResult;
	std::string jsonParseErrors = Utils::StringProcess::StringToJson(response->body, &jsonResult);
	if (!jsonParseErrors.empty())
		throw DirectoryError("cannot parse directory", jsonParseErrors);

	return Directory::FromJson(baseUrl, jsonResult);
}

Acme::Nonce Acme::DirectoryClient::fetchNonce(const Directory& directory)
{
	std::string newNonceUrl = directory.endpoint("newNonce");
	if (newNonceUrl.empty())
		throw NonceError("cannot fetch replay-nonce", "directory has no 'newNonce' endpoint");

	/* Request */
	std::shared_ptr<httplib::Response> response;
	try
	{
		response = cli->head(newNonceUrl, DefaultHeaders());
	}
	catch (Utils::APIRequestException& e)
	{
		throw NonceError("cannot fetch replay-nonce", e.what());
	}

	if (response == nullptr)
		throw NonceError("cannot fetch replay-nonce", newNonceUrl + " did not respond");
	else if (response->status != 200 and response->status != 204)
		throw NonceError("cannot fetch replay-nonce", newNonceUrl + " returns http code " + std::to_string(response->status));

	Nonce nonce = ReplayNonce(*response);
	if (nonce.empty())
		throw NonceError("cannot fetch replay-nonce", "no \"Replay-Nonce\" in response header");
	return nonce;
}

Acme::Nonce Acme::DirectoryClient::ReplayNonce(const httplib::Response& response)
{
	if (!response.has_header("Replay-Nonce"))
		return Nonce();
	return response.get_header_value("Replay-Nonce");
}
