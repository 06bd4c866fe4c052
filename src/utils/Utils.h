//
// Created by nova on 8/19/20.
//

#ifndef ACMEREG_UTILS_H
#define ACMEREG_UTILS_H

#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <tuple>
#include <algorithm>
#include <chrono>
#include <regex>
#include <json/json.h>

namespace Utils
{
	/* Accepts a bare addr-spec ("ops@example.com") or a name-addr ("Ops <ops@example.com>").
	 * Returns: the addr-spec part, or "" if the address is not well formed. */
	std::string ParseEmailAddress(const std::string& address);
	bool EmailIsValid(const std::string& email);

	/* 1 - Struct types in openssl such as EVP_PKEY contain pointers that point to another heap memory
	 * and have their own delete function like EVP_PKEY_free(EVP_PKEY* ptr).
	 * 2 - Smart pointer created with bare pointer also needs a custom deleter. */
	template<auto FreeFunc> struct Deleter { template<class T> void operator()(T* ptr) { FreeFunc(ptr); } };

	namespace Time
	{
		/* UTC time zone range: -12 ~ +14 */
		std::string UnixTimeToRFC3339(long utcTime, int timeZone);
		/* Return time zone offset, from -12 to +14 */
		int localTimeZoneUTC();
	}

	namespace StringProcess
	{
		std::string ToLowerCase(const std::string& str);
		std::shared_ptr<std::vector<std::byte>> StringToByteVec(const std::string& str);
		std::string ByteVecToString(const std::shared_ptr<const std::vector<std::byte>>& vec);
		/* Returns: parse errors, "" on success */
		std::string StringToJson(const std::string& jString, Json::Value* json);
		/* Single line, no indentation. Object members come out in key order. */
		std::string JsonToCompactString(const Json::Value& json);
	}

	namespace Codec
	{
		const char base64UrlTable[] =
		{
			'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
			'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
			'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
			'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
			'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '-', '_'
		};
		/* No padding on output, decoding stops at the first character outside the table. */
		std::string Base64UrlEncode(const std::string& in);
		std::string Base64UrlDecode(const std::string& in);
		std::string Base64UrlEncode(const std::shared_ptr<const std::vector<std::byte>>& in);
		std::shared_ptr<std::vector<std::byte>> Base64UrlDecodeToBytes(const std::string& in);
	}

	namespace URL
	{
		/* "https://host:port/some/path" to <"https://host:port", "/some/path">
		 * Returns: <"", ""> if the url is not an absolute http(s) url */
		std::tuple<std::string, std::string> Split(const std::string& url);
		bool IsValid(const std::string& url);
	}

	class AllocateMemoryFailed : public std::exception
	{
	public:
		AllocateMemoryFailed() = default;
		explicit AllocateMemoryFailed(std::string str) : message(std::move(str)) {}
		~AllocateMemoryFailed() noexcept override = default;
		[[nodiscard]] const char* what() const noexcept override { return message.c_str(); }

	private:
		std::string message;
	};

	class APIRequestException : public std::exception
	{
	public:
		APIRequestException() = default;
		explicit APIRequestException(std::string str) : message(std::move(str)) {}
		~APIRequestException() noexcept override = default;
		[[nodiscard]] const char* what() const noexcept override { return message.c_str(); }

	private:
		std::string message;
	};
}

#endif //ACMEREG_UTILS_H
