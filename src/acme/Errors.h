//
// Created by nova on 3/6/21.
//

#ifndef ACMEREG_ERRORS_H
#define ACMEREG_ERRORS_H

#include <string>
#include <utility>
#include <exception>

namespace Acme
{
	/* Base of every error a registration run can end with.
	 * what() reads "<kind>: <message>" followed by " (<cause>)" when a cause is known. */
	class Error : public std::exception
	{
	public:
		Error(std::string kind, std::string message, std::string cause) :
				errorKind(std::move(kind)), errorMessage(std::move(message)), errorCause(std::move(cause))
		{
			full = errorKind + ": " + errorMessage;
			if (!errorCause.empty())
				full += " (" + errorCause + ")";
		}
		~Error() noexcept override = default;
		[[nodiscard]] const char* what() const noexcept override { return full.c_str(); }
		[[nodiscard]] const std::string& kind() const noexcept { return errorKind; }
		[[nodiscard]] const std::string& message() const noexcept { return errorMessage; }
		[[nodiscard]] const std::string& cause() const noexcept { return errorCause; }

	private:
		std::string errorKind;
		std::string errorMessage;
		std::string errorCause;
		std::string full;
	};

	/* Bad email address, bad output path */
	class InputError : public Error
	{
	public:
		explicit InputError(std::string message, std::string cause = "") :
				Error("InputError", std::move(message), std::move(cause)) {}
	};

	/* Key generation or encoding failed */
	class CryptoError : public Error
	{
	public:
		explicit CryptoError(std::string message, std::string cause = "") :
				Error("CryptoError", std::move(message), std::move(cause)) {}
	};

	class DirectoryError : public Error
	{
	public:
		explicit DirectoryError(std::string message, std::string cause = "") :
				Error("DirectoryError", std::move(message), std::move(cause)) {}
	};

	class NonceError : public Error
	{
	public:
		explicit NonceError(std::string message, std::string cause = "") :
				Error("NonceError", std::move(message), std::move(cause)) {}
	};

	class SigningError : public Error
	{
	public:
		explicit SigningError(std::string message, std::string cause = "") :
				Error("SigningError", std::move(message), std::move(cause)) {}
	};

	/* The CA rejected the request. Problem fields are empty (status 0) when
	 * the CA sent no problem document, or when no response arrived at all. */
	class RegistrationError : public Error
	{
	public:
		explicit RegistrationError(std::string message, std::string cause = "",
		                           std::string problemType = "", std::string problemDetail = "", int status = 0) :
				Error("RegistrationError", std::move(message), std::move(cause)),
				type(std::move(problemType)), detail(std::move(problemDetail)), httpStatus(status) {}
		[[nodiscard]] const std::string& problemType() const noexcept { return type; }
		[[nodiscard]] const std::string& problemDetail() const noexcept { return detail; }
		[[nodiscard]] int status() const noexcept { return httpStatus; }

	private:
		std::string type;
		std::string detail;
		int httpStatus;
	};

	class TermsNotAcceptedError : public Error
	{
	public:
		explicit TermsNotAcceptedError(std::string message, std::string cause = "") :
				Error("TermsNotAcceptedError", std::move(message), std::move(cause)) {}
	};

	/* A success response without the data it must carry */
	class InvariantError : public Error
	{
	public:
		explicit InvariantError(std::string message, std::string cause = "") :
				Error("InvariantError", std::move(message), std::move(cause)) {}
	};

	class PersistenceError : public Error
	{
	public:
		explicit PersistenceError(std::string message, std::string cause = "") :
				Error("PersistenceError", std::move(message), std::move(cause)) {}
	};
}

#endif //ACMEREG_ERRORS_H
