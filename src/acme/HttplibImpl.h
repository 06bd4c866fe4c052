//
// Created by nova on 3/8/21.
//

#ifndef ACMEREG_HTTPLIBIMPL_H
#define ACMEREG_HTTPLIBIMPL_H

#include <json/json.h>
#include "Transport.h"

#define DEFAULT_CA_CERT_PATH "/etc/ssl/certs/ca-certificates.crt"
#define DEFAULT_TIMEOUT_SECONDS 8

namespace HTTP
{
	/* Implementation over cpp-httplib, one connection per request */
	class HttplibImpl : public HTTP::Client
	{
	public:
		/* Structure of 'settings', both optional:
		 * {
		 *     "timeout": 8,
		 *     "ca_cert_path": "/etc/ssl/certs/ca-certificates.crt"
		 * } */
		explicit HttplibImpl(const Json::Value& settings);
		~HttplibImpl() override = default;

		std::shared_ptr<httplib::Response> get(const std::string& url, const httplib::Headers& headers) override;
		std::shared_ptr<httplib::Response> head(const std::string& url, const httplib::Headers& headers) override;
		std::shared_ptr<httplib::Response> post(const std::string& url, const httplib::Headers& headers,
		                                        const std::string& body, const std::string& contentType) override;

	private:
		/* Exceptions: Utils::APIRequestException() */
		std::unique_ptr<httplib::Client> connect(const std::string& url, std::string* path);
		static std::shared_ptr<httplib::Response> unwrap(const httplib::Result& result);

		int timeoutSeconds = DEFAULT_TIMEOUT_SECONDS;
		std::string caCertPath = DEFAULT_CA_CERT_PATH;
	};
}

#endif //ACMEREG_HTTPLIBIMPL_H
