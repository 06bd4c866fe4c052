//
// Created by nova on 8/19/20.
//

#include <iomanip>
#include <sstream>
#include <ctime>
#include "Utils.h"

std::string Utils::StringProcess::ToLowerCase(const std::string& str)
{
	std::string copy = str;
	std::transform(copy.begin(), copy.end(), copy.begin(), [](unsigned char c) { return std::tolower(c); });
	return copy;
}

std::string Utils::Codec::Base64UrlEncode(const std::string& in)
{
	std::string out;
	int val = 0, valb = -6;
	size_t len = in.length();
	for (unsigned int i = 0; i < len; i++)
	{
		unsigned char c = in[i];
		val = (val << 8) + c;
		valb += 8;
		while (valb >= 0)
		{
			out.push_back(base64UrlTable[(val >> valb) & 0x3F]);
			valb -= 6;
		}
	}
	if (valb > -6)
	{
		out.push_back(base64UrlTable[((val << 8) >> (valb + 8)) & 0x3F]);
	}
	return out;
}

std::string Utils::Codec::Base64UrlDecode(const std::string& in)
{
	std::string out;
	std::vector<int> T(256, -1);
	for (unsigned int i = 0; i < 64; i++)
		T[(unsigned char)base64UrlTable[i]] = i;

	int val = 0, valb = -8;
	for (unsigned char c : in)
	{
		if (T[c] == -1)
			break;
		val = (val << 6) + T[c];
		valb += 6;
		if (valb >= 0)
		{
			out.push_back(char((val >> valb) & 0xFF));
			valb -= 8;
		}
	}
	return out;
}

std::string Utils::Codec::Base64UrlEncode(const std::shared_ptr<const std::vector<std::byte>>& in)
{
	std::string out;
	int val = 0, valb = -6;
	size_t len = in->size();
	for (unsigned int i = 0; i < len; i++)
	{
		auto c = (unsigned char)(*in)[i];
		val = (val << 8) + c;
		valb += 8;
		while (valb >= 0)
		{
			out.push_back(base64UrlTable[(val >> valb) & 0x3F]);
			valb -= 6;
		}
	}
	if (valb > -6)
	{
		out.push_back(base64UrlTable[((val << 8) >> (valb + 8)) & 0x3F]);
	}
	return out;
}

std::shared_ptr<std::vector<std::byte>> Utils::Codec::Base64UrlDecodeToBytes(const std::string& in)
{
	return Utils::StringProcess::StringToByteVec(Base64UrlDecode(in));
}

std::shared_ptr<std::vector<std::byte>> Utils::StringProcess::StringToByteVec(const std::string& str)
{
	const auto* cstr = str.c_str();
	return std::make_shared<std::vector<std::byte>>((std::byte*)cstr, (std::byte*)cstr + str.size());
}

std::string Utils::StringProcess::ByteVecToString(const std::shared_ptr<const std::vector<std::byte>>& vec)
{
	const auto* ptr = vec->data();
	return std::string((char*)ptr, (char*)ptr + vec->size());
}

std::string Utils::Time::UnixTimeToRFC3339(long utcTime, int timeZone)
{
	if (timeZone < -12 or timeZone > 14)
		return std::string();

	/* Get time zone shift */
	long shift = timeZone * 60 * 60;

	/* Get "%Y-%m-%d %H:%M:%S" */
	std::time_t tmp = utcTime + shift;
	std::tm* t = std::gmtime(&tmp);
	std::stringstream ss;
	ss << std::put_time(t, "%Y-%m-%d %H:%M:%S");
	std::string str = ss.str();

	/* To rfc-3339 format */
	auto pos = str.find(' ');
	std::string date = str.substr(0, pos);
	std::string time = str.substr(pos + 1, str.size());
	std::string zonePart = timeZone < 0 ? std::to_string(-timeZone) : std::to_string(timeZone);
	if (zonePart.size() == 1)
		zonePart = "0" + zonePart;

	return date + "T" + time + (timeZone < 0 ? "-" : "+") + zonePart + ":00";
}

int Utils::Time::localTimeZoneUTC()
{
	auto now = std::time(nullptr);
	auto const tm = *std::localtime(&now);
	std::ostringstream os;
	os << std::put_time(&tm, "%z");
	std::string s = os.str();

	int h = std::stoi(s.substr(0, 3), nullptr, 10);
	int m = std::stoi(s[0] + s.substr(3), nullptr, 10);

	return (h * 3600 + m * 60) / 60 / 60;
}

std::string Utils::StringProcess::StringToJson(const std::string& jString, Json::Value* json)
{
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	std::string jsonParseErrors;
	auto ok = reader->parse(jString.c_str(), jString.c_str() + jString.size(), json, &jsonParseErrors);
	if (!ok)
		return jsonParseErrors.empty() ? std::string("unknown json parse error") : jsonParseErrors;
	else
		return std::string();
}

std::string Utils::StringProcess::JsonToCompactString(const Json::Value& json)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	builder["emitUTF8"] = true;
	return Json::writeString(builder, json);
}

std::string Utils::ParseEmailAddress(const std::string& address)
{
	/* name-addr: display name followed by the addr-spec in angle brackets */
	static const std::regex nameAddr(R"(^\s*[^<>@]*<([^<>]+)>\s*$)");
	std::smatch match;
	std::string addrSpec = address;
	if (std::regex_match(address, match, nameAddr))
		addrSpec = match[1].str();

	return EmailIsValid(addrSpec) ? addrSpec : std::string();
}

bool Utils::EmailIsValid(const std::string& email)
{
	if (email.empty() or email.size() > 254)
		return false;

	/* dot-atom local part, dot separated domain labels */
	static const std::regex pattern(
			R"(^[A-Za-z0-9!#$%&'*+/=?^_`{|}~-]+(\.[A-Za-z0-9!#$%&'*+/=?^_`{|}~-]+)*)"
			R"(@[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*$)");
	if (!std::regex_match(email, pattern))
		return false;

	return email.find('@') <= 64;     /* Local part is at most 64 octets */
}

std::tuple<std::string, std::string> Utils::URL::Split(const std::string& url)
{
	static const std::regex pattern(R"(^(https?://[^/?#\s]+)([^\s]*)$)", std::regex::icase);
	std::smatch match;
	if (!std::regex_match(url, match, pattern))
		return std::make_tuple(std::string(), std::string());

	std::string path = match[2].str();
	if (path.empty())
		path = "/";
	else if (path[0] != '/')     /* Query right after the authority, "https://host?x" */
		path = "/" + path;
	return std::make_tuple(match[1].str(), path);
}

bool Utils::URL::IsValid(const std::string& url)
{
	return !std::get<0>(Split(url)).empty();
}
