//
// Created by nova on 3/8/21.
//

#ifndef ACMEREG_DIRECTORY_H
#define ACMEREG_DIRECTORY_H

#include <map>
#include <string>
#include <memory>
#include <vector>
#include <json/json.h>
#include "Errors.h"
#include "Transport.h"
#include "../utils/Codes.h"

#define USER_AGENT "acmereg/" VERSION

namespace Acme
{
	/* Single-use replay-nonce. Each response carries the next one in its "Replay-Nonce" header. */
	using Nonce = std::string;

	/* Endpoint names every registration needs */
	const std::vector<std::string>& RequiredEndpoints();

	/* Resources published by the CA at its directory url */
	struct Directory
	{
		std::string url;                                /* Where it was fetched from */
		std::map<std::string, std::string> endpoints;   /* <name, url>, e.g. <"newAccount", "https://.../new-acct"> */
		/* "meta" object */
		std::string termsOfService;
		std::string website;
		std::vector<std::string> caaIdentities;
		bool externalAccountRequired = false;

		[[nodiscard]] bool has(const std::string& name) const;
		/* Returns: "" if the CA does not publish this endpoint */
		[[nodiscard]] std::string endpoint(const std::string& name) const;

		/* Exceptions: DirectoryError() */
		static Directory FromJson(const std::string& url, const Json::Value& json);
	};

	class DirectoryClient
	{
	public:
		explicit DirectoryClient(std::shared_ptr<HTTP::Client> client) : cli(std::move(client)) {}
		~DirectoryClient() = default;

		/* GET the directory.
		 * Exceptions: DirectoryError() */
		Directory fetchDirectory(const std::string& baseUrl);

		/* HEAD newNonce.
		 * Exceptions: NonceError() */
		Nonce fetchNonce(const Directory& directory);

		/* Returns: "" if the response carries no nonce */
		static Nonce ReplayNonce(const httplib::Response& response);

		static const httplib::Headers& DefaultHeaders();

	private:
		std::shared_ptr<HTTP::Client> cli;
	};
}

#endif //ACMEREG_DIRECTORY_H
