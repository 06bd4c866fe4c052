//
// Created by nova on 3/8/21.
//

#include "HttplibImpl.h"
#include "../utils/Utils.h"

HTTP::HttplibImpl::HttplibImpl(const Json::Value& settings)
{
	if (settings["timeout"].isInt() and settings["timeout"].asInt() > 0)
		timeoutSeconds = settings["timeout"].asInt();
	if (settings["ca_cert_path"].isString())
		caCertPath = settings["ca_cert_path"].asString();
}

std::unique_ptr<httplib::Client> HTTP::HttplibImpl::connect(const std::string& url, std::string* path)
{
	auto [schemeHostPort, urlPath] = Utils::URL::Split(url);
	if (schemeHostPort.empty())
		throw Utils::APIRequestException("malformed url: " + url);
	*path = urlPath;

	auto cli = std::make_unique<httplib::Client>(schemeHostPort);
#ifdef __linux__
	cli->set_ca_cert_path(caCertPath.c_str());
#endif
	cli->enable_server_certificate_verification(true);
	cli->set_connection_timeout(timeoutSeconds, 0);
	cli->set_read_timeout(timeoutSeconds, 0);
	cli->set_write_timeout(timeoutSeconds, 0);
	return cli;
}

std::shared_ptr<httplib::Response> HTTP::HttplibImpl::unwrap(const httplib::Result& result)
{
	if (!result)
		return nullptr;
	return std::make_shared<httplib::Response>(result.value());
}

std::shared_ptr<httplib::Response> HTTP::HttplibImpl::get(const std::string& url, const httplib::Headers& headers)
{
	std::string path;
	auto cli = connect(url, &path);
	return unwrap(cli->Get(path, headers));
}

std::shared_ptr<httplib::Response> HTTP::HttplibImpl::head(const std::string& url, const httplib::Headers& headers)
{
	std::string path;
	auto cli = connect(url, &path);
	return unwrap(cli->Head(path, headers));
}

std::shared_ptr<httplib::Response> HTTP::HttplibImpl::post(const std::string& url, const httplib::Headers& headers,
                                                           const std::string& body, const std::string& contentType)
{
	std::string path;
	auto cli = connect(url, &path);
	return unwrap(cli->Post(path, headers, body, contentType));
}
