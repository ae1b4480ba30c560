// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "File.hxx"
#include "Data.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "io/FileReader.hxx"
#include "io/BufferedReader.hxx"
#include "util/StringUtil.hxx"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <stdexcept>

namespace {

constexpr bool
IsNameChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_';
}

/**
 * The tokens of one line: a name followed by a quoted value or a
 * brace.  A '#' outside of quotes starts a comment.
 */
class ConfigLine {
	std::string_view rest;

public:
	explicit ConfigLine(std::string_view line) noexcept
		:rest(StripLeft(line)) {}

	bool IsEnd() const noexcept {
		return rest.empty() || rest.front() == '#';
	}

	/**
	 * Consume @ch if it is the next token.
	 */
	bool Skip(char ch) noexcept {
		if (rest.empty() || rest.front() != ch)
			return false;

		rest = StripLeft(rest.substr(1));
		return true;
	}

	std::string_view NextName() {
		const auto n = std::find_if_not(rest.begin(), rest.end(),
						IsNameChar) - rest.begin();
		if (n == 0)
			throw std::runtime_error("Setting name expected");

		const auto name = rest.substr(0, n);
		rest = StripLeft(rest.substr(n));
		return name;
	}

	/**
	 * Parse a double-quoted string.  A backslash escapes the
	 * following character.
	 */
	std::string NextValue() {
		if (IsEnd())
			throw std::runtime_error("Value missing");

		if (rest.front() != '"')
			throw std::runtime_error("'\"' expected");

		std::string value;
		std::size_t i = 1;
		while (true) {
			if (i >= rest.size())
				throw std::runtime_error("Missing closing '\"'");

			char ch = rest[i++];
			if (ch == '"')
				break;

			if (ch == '\\' && i < rest.size())
				ch = rest[i++];

			value.push_back(ch);
		}

		rest = StripLeft(rest.substr(i));
		return value;
	}

	void ExpectEnd(std::string_view after) const {
		if (!IsEnd())
			throw FmtRuntimeError("Unknown tokens after {}", after);
	}
};

class ConfigFileParser {
	BufferedReader &reader;
	ConfigData &data;

public:
	ConfigFileParser(BufferedReader &_reader, ConfigData &_data) noexcept
		:reader(_reader), data(_data) {}

	void Parse();

private:
	int GetLineNumber() const noexcept {
		return int(reader.GetLineNumber());
	}

	/**
	 * Skip empty lines and comments.
	 *
	 * @return std::nullopt at the end of the file
	 */
	std::optional<ConfigLine> NextLine();

	void ParseBlock(ConfigBlockOption option, std::string_view name,
			ConfigLine &line);

	ConfigBlock ReadBlockBody();
};

std::optional<ConfigLine>
ConfigFileParser::NextLine()
{
	while (const char *s = reader.ReadLine()) {
		ConfigLine line{s};
		if (!line.IsEnd())
			return line;
	}

	return std::nullopt;
}

ConfigBlock
ConfigFileParser::ReadBlockBody()
{
	ConfigBlock block(GetLineNumber());

	while (true) {
		auto line = NextLine();
		if (!line)
			throw std::runtime_error("Expected '}' before end of file");

		if (line->Skip('}')) {
			line->ExpectEnd("'}'");
			return block;
		}

		const auto name = line->NextName();
		const auto value = line->NextValue();
		line->ExpectEnd("value");

		const auto duplicate =
			std::find_if(block.params.begin(), block.params.end(),
				     [name](const ConfigParam &p){
					     return p.name == name;
				     });
		if (duplicate != block.params.end())
			throw FmtRuntimeError("\"{}\" is duplicate, first defined on line {}",
					      name, duplicate->line);

		block.AddParam(name, value, GetLineNumber());
	}
}

void
ConfigFileParser::ParseBlock(ConfigBlockOption option, std::string_view name,
			     ConfigLine &line)
{
	if (!IsRepeatable(option))
		if (const auto *previous = data.GetBlock(option))
			throw FmtRuntimeError("Block \"{}\" was already defined on line {}",
					      name, previous->line);

	if (!line.Skip('{'))
		throw std::runtime_error("'{' expected");

	line.ExpectEnd("'{'");

	/* this invalidates "line" and "name" */
	data.AddBlock(option, ReadBlockBody());
}

void
ConfigFileParser::Parse()
{
	while (auto line = NextLine()) {
		const auto name = line->NextName();

		if (const auto option = ParseConfigOptionName(name);
		    option != ConfigOption::MAX) {
			const auto value = line->NextValue();
			line->ExpectEnd("value");

			/* the last occurrence wins */
			data.SetParam(option, ConfigParam({}, value,
							  GetLineNumber()));
		} else if (const auto block_option = ParseConfigBlockOptionName(name);
			   block_option != ConfigBlockOption::MAX) {
			ParseBlock(block_option, name, *line);
		} else
			throw FmtRuntimeError("Unknown setting \"{}\"", name);
	}
}

} // anonymous namespace

void
ReadConfigFile(ConfigData &data, const char *path)
{
	FileReader file(path);
	BufferedReader reader(file);

	try {
		ConfigFileParser(reader, data).Parse();
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       path,
						       reader.GetLineNumber()));
	}
}
