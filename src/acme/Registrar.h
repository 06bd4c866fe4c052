//
// Created by nova on 3/9/21.
//

#ifndef ACMEREG_REGISTRAR_H
#define ACMEREG_REGISTRAR_H

#include <string>
#include <vector>
#include <memory>
#include <json/json.h>
#include "AccountKey.h"
#include "Directory.h"
#include "JWS.h"
#include "Errors.h"

namespace Acme
{
	/* The CA's view of the registrant */
	struct Account
	{
		std::string uri;                    /* From the "Location" header, used as "kid" afterwards */
		std::string status;                 /* "valid", "deactivated", "revoked", "" if not in the body */
		std::vector<std::string> contact;
		std::string orders;
	};

	/* Outcome of a new-account request. 201 and 200 differ only in 'created'. */
	struct Registration
	{
		bool created = false;
		Account account;
		Nonce replayNonce;                  /* Nonce for the next request, "" if the CA sent none */
	};

	enum class RegistrationState
	{
		Unregistered,
		NonceAcquired,
		RequestSigned,
		Submitted,
		Registered,
		Failed
	};
	std::string ToString(RegistrationState state);

	/* newAccount payload: {"contact": ["mailto:<email>"], "termsOfServiceAgreed": true} */
	Json::Value RegistrationRequest(const std::string& contactEmail, bool acceptTermsOfService);

	/* One registration session. Not to be shared between concurrent registrations. */
	class Registrar
	{
	public:
		explicit Registrar(std::shared_ptr<HTTP::Client> client) : cli(client), directoryClient(std::move(client)) {}
		~Registrar() = default;

		/* Exceptions: InputError()
		 *             TermsNotAcceptedError()
		 *             DirectoryError()
		 *             NonceError()
		 *             SigningError()
		 *             RegistrationError()
		 *             InvariantError() */
		Account registerAccount(const AccountKey& key, const Directory& directory,
		                        const std::string& contactEmail, bool acceptTermsOfService);

		/* Same as registerAccount() but keeps the tagged result.
		 * An empty 'nonce' is fetched from the directory's newNonce endpoint. */
		Registration submit(const AccountKey& key, const Directory& directory,
		                    const std::string& contactEmail, bool acceptTermsOfService,
		                    const Nonce& nonce = Nonce());

		[[nodiscard]] RegistrationState state() const { return currentState; }

	private:
		Registration interpret(const httplib::Response& response, const std::string& newAccountUrl);
		static Account ParseAccount(const std::string& uri, const std::string& body);
		static RegistrationError ProblemError(const httplib::Response& response);

		std::shared_ptr<HTTP::Client> cli;
		DirectoryClient directoryClient;
		RegistrationState currentState = RegistrationState::Unregistered;
	};
}

#endif //ACMEREG_REGISTRAR_H
