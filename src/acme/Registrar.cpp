//
// Created by nova on 3/9/21.
//

#include <regex>
#include "Registrar.h"
#include "../utils/Utils.h"

std::string Acme::ToString(RegistrationState state)
{
	switch (state)
	{
		case RegistrationState::Unregistered:  return "Unregistered";
		case RegistrationState::NonceAcquired: return "NonceAcquired";
		case RegistrationState::RequestSigned: return "RequestSigned";
		case RegistrationState::Submitted:     return "Submitted";
		case RegistrationState::Registered:    return "Registered";
		case RegistrationState::Failed:        return "Failed";
	}
	return "Unknown";
}

Json::Value Acme::RegistrationRequest(const std::string& contactEmail, bool acceptTermsOfService)
{
	Json::Value payload;
	payload["contact"] = Json::arrayValue;
	payload["contact"].append("mailto:" + contactEmail);
	payload["termsOfServiceAgreed"] = acceptTermsOfService;
	return payload;
}

Acme::Account Acme::Registrar::registerAccount(const AccountKey& key, const Directory& directory,
                                               const std::string& contactEmail, bool acceptTermsOfService)
{
	return submit(key, directory, contactEmail, acceptTermsOfService).account;
}

Acme::Registration Acme::Registrar::submit(const AccountKey& key, const Directory& directory,
                                           const std::string& contactEmail, bool acceptTermsOfService,
                                           const Nonce& nonce)
{
	currentState = RegistrationState::Unregistered;
	try
	{
		/* Everything that can be refused locally is refused before the first request */
		if (contactEmail.empty())
			throw InputError("contact email is empty");
		std::string address = Utils::ParseEmailAddress(contactEmail);
		if (address.empty())
			throw InputError("contact email is invalid", contactEmail);
		if (!acceptTermsOfService)
			throw TermsNotAcceptedError("the CA's terms of service must be agreed to before registering",
			                            directory.termsOfService);
		for (const auto& name : RequiredEndpoints())
		{
			if (!directory.has(name))
				throw DirectoryError("directory has no '" + name + "' endpoint", directory.url);
		}
		std::string newAccountUrl = directory.endpoint("newAccount");

		/* Get nonce */
		Nonce requestNonce = nonce.empty() ? directoryClient.fetchNonce(directory) : nonce;
		currentState = RegistrationState::NonceAcquired;

		/* Sign with the public JWK, there is no account url to use as "kid" yet */
		auto envelope = JWS::Sign(key, newAccountUrl, requestNonce, RegistrationRequest(address, acceptTermsOfService), "");
		currentState = RegistrationState::RequestSigned;

		/* Request */
		std::shared_ptr<httplib::Response> response;
		try
		{
			response = cli->post(newAccountUrl, DirectoryClient::DefaultHeaders(), envelope.body(), "application/jose+json");
		}
		catch (Utils::APIRequestException& e)
		{
			throw RegistrationError("cannot submit new-account request", e.what());
		}
		if (response == nullptr)
			throw RegistrationError("cannot submit new-account request", newAccountUrl + " did not respond");
		currentState = RegistrationState::Submitted;

		Registration registration = interpret(*response, newAccountUrl);
		currentState = RegistrationState::Registered;
		return registration;
	}
	catch (Error&)
	{
		currentState = RegistrationState::Failed;
		throw;
	}
	catch (Json::Exception& e)
	{
		currentState = RegistrationState::Failed;
		throw InvariantError("unexpected value in CA response", e.what());
	}
}

Acme::Registration Acme::Registrar::interpret(const httplib::Response& response, const std::string& newAccountUrl)
{
	if (response.status >= 400)
		throw ProblemError(response);
	else if (response.status != 200 and response.status != 201)
		throw RegistrationError("unexpected response to new-account request",
		                        newAccountUrl + " returns http code " + std::to_string(response.status),
		                        "", "", response.status);

	/* 201: created, 200: this key is already registered, "Location" is the existing account either way */
	std::string location = response.has_header("Location") ? response.get_header_value("Location") : std::string();
	if (location.empty())
		throw InvariantError("CA accepted the new-account request but returned no account url",
		                     "http code " + std::to_string(response.status) + " without \"Location\" header");

	Registration registration;
	registration.created = response.status == 201;
	registration.account = ParseAccount(location, response.body);
	registration.replayNonce = DirectoryClient::ReplayNonce(response);
	return registration;
}

Acme::Account Acme::Registrar::ParseAccount(const std::string& uri, const std::string& body)
{
	Account account;
	account.uri = uri;

	/* The body is informational, a missing or malformed one does not fail the registration */
	Json::Value jsonResult;
	if (body.empty() or !Utils::StringProcess::StringToJson(body, &jsonResult).empty() or !jsonResult.isObject())
		return account;

	if (jsonResult["status"].isString())
		account.status = jsonResult["status"].asString();
	if (jsonResult["orders"].isString())
		account.orders = jsonResult["orders"].asString();
	if (jsonResult["contact"].isArray())
	{
		for (const auto& contact : jsonResult["contact"])
		{
			if (contact.isString())
				account.contact.push_back(contact.asString());
		}
	}
	return account;
}

Acme::RegistrationError Acme::Registrar::ProblemError(const httplib::Response& response)
{
	std::string cause = "http code " + std::to_string(response.status);

	Json::Value problem;
	if (!response.body.empty() and Utils::StringProcess::StringToJson(response.body, &problem).empty() and problem.isObject())
	{
		std::string type = problem["type"].isString() ? problem["type"].asString() : std::string();
		std::string detail = problem["detail"].isString() ? problem["detail"].asString() : std::string();
		int status = problem["status"].isInt() ? problem["status"].asInt() : response.status;
		if (!type.empty())
			cause += ", " + type;
		if (!detail.empty())
			cause += ": " + detail;
		return RegistrationError("CA rejected the new-account request", cause, type, detail, status);
	}

	if (!response.body.empty())
		cause += ": " + std::regex_replace(response.body, std::regex("\n"), "");
	return RegistrationError("CA rejected the new-account request", cause, "", "", response.status);
}
