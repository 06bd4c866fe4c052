//
// Created by nova on 3/8/21.
//

#ifndef ACMEREG_TRANSPORT_H
#define ACMEREG_TRANSPORT_H

#include <memory>
#include <string>
#include <httplib.h>

namespace HTTP
{
	/* Base class of all transports.
	 * Urls are absolute ("https://host[:port]/path").
	 * Returns: nullptr if the server could not be reached or did not respond.
	 * Exceptions: Utils::APIRequestException() if the url is malformed. */
	class Client
	{
	public:
		virtual ~Client() = default;

		virtual std::shared_ptr<httplib::Response> get(const std::string& url, const httplib::Headers& headers) = 0;

		virtual std::shared_ptr<httplib::Response> head(const std::string& url, const httplib::Headers& headers) = 0;

		virtual std::shared_ptr<httplib::Response> post(const std::string& url, const httplib::Headers& headers,
		                                                const std::string& body, const std::string& contentType) = 0;
	};
}

#endif //ACMEREG_TRANSPORT_H
