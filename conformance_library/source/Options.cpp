// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/Options.hpp"
#include "TimestampDateKit/conformance/Common.hpp"

#include <algorithm>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cstddef>
#include <cstdlib>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace rj = rapidjson;

namespace TimestampDateKit::conformance
{

namespace
{

using namespace boost::archive::iterators;
using Base64Encoder = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;
using Base64Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

std::string base64_encode(const std::string &data)
{
	std::string encoded(Base64Encoder(data.begin()), Base64Encoder(data.end()));
	encoded.append((3 - data.size() % 3) % 3, '=');
	return encoded;
}

bool is_base64_char(char c)
{
	return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' ||
		   c == '/';
}

// padded standard alphabet only
std::string base64_decode(std::string encoded)
{
	if (encoded.size() % 4 != 0)
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "base64 length is not a multiple of 4");
	size_t padding = 0;
	while (padding < 2 && !encoded.empty() && encoded[encoded.size() - 1 - padding] == '=')
		++padding;
	if (!std::all_of(encoded.begin(), encoded.end() - static_cast<std::ptrdiff_t>(padding), is_base64_char))
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "invalid base64 character");

	std::replace(encoded.end() - static_cast<std::ptrdiff_t>(padding), encoded.end(), '=', 'A');
	try {
		std::string decoded(Base64Decoder(encoded.cbegin()), Base64Decoder(encoded.cend()));
		decoded.erase(decoded.size() - padding);
		return decoded;
	} catch (const dataflow_exception &e) {
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, std::string("invalid base64: ") + e.what());
	}
}

} // namespace

bridge::Command Options::command() const
{
	return bridge::Command{cmd, args, dir};
}

std::string encode_options(const Options &options)
{
	if (options.cmd.empty())
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "options cmd is empty");

	rj::StringBuffer buffer;
	rj::Writer<rj::StringBuffer> writer(buffer);
	writer.StartObject();
	writer.Key("cmd");
	writer.String(options.cmd.c_str(), static_cast<rj::SizeType>(options.cmd.size()));
	writer.Key("args");
	writer.StartArray();
	for (const auto &arg : options.args)
		writer.String(arg.c_str(), static_cast<rj::SizeType>(arg.size()));
	writer.EndArray();
	writer.Key("dir");
	writer.String(options.dir.c_str(), static_cast<rj::SizeType>(options.dir.size()));
	writer.EndObject();

	return base64_encode(std::string(buffer.GetString(), buffer.GetSize()));
}

Options decode_options(const std::string &encoded)
{
	if (encoded.empty())
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "options are empty");

	const std::string json = base64_decode(encoded);
	rj::Document doc;
	doc.Parse(json.c_str(), json.size());
	if (doc.HasParseError())
		TDK_CONFORMANCE_THROW(exception::ConfigurationError,
							  std::string("invalid options JSON: ") + rj::GetParseError_En(doc.GetParseError()) +
								  " at offset " + std::to_string(doc.GetErrorOffset()));
	if (!doc.IsObject())
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "options JSON is not an object");

	Options options;
	if (doc.HasMember("cmd") && doc["cmd"].IsString())
		options.cmd.assign(doc["cmd"].GetString(), doc["cmd"].GetStringLength());
	if (doc.HasMember("args") && doc["args"].IsArray()) {
		for (const auto &arg : doc["args"].GetArray()) {
			if (!arg.IsString())
				TDK_CONFORMANCE_THROW(exception::ConfigurationError, "options args must be strings");
			options.args.emplace_back(arg.GetString(), arg.GetStringLength());
		}
	}
	if (doc.HasMember("dir") && doc["dir"].IsString())
		options.dir.assign(doc["dir"].GetString(), doc["dir"].GetStringLength());

	if (options.cmd.empty())
		TDK_CONFORMANCE_THROW(exception::ConfigurationError, "options cmd is empty");
	return options;
}

std::optional<Options> options_from_environment()
{
	const char *value = std::getenv(FUZZ_OPTIONS_VARIABLE);
	if (value == nullptr || value[0] == '\0')
		return std::nullopt;
	return decode_options(value);
}

} // namespace TimestampDateKit::conformance
