// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

const char *
OptionParser::TakeValue(const char *arg, const OptionDef &option)
{
	if (!option.has_value)
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", arg);

	return Shift();
}

OptionParser::Result
OptionParser::ParseLong(const char *arg)
{
	/* "--name" or "--name=value" */
	std::string_view name{arg + 2};
	const char *inline_value = nullptr;
	if (const auto eq = name.find('='); eq != name.npos) {
		inline_value = arg + 2 + eq + 1;
		name = name.substr(0, eq);
	}

	for (const auto &i : options) {
		if (i.long_option == nullptr || name != i.long_option)
			continue;

		if (inline_value == nullptr)
			return {int(&i - options.data()), TakeValue(arg, i)};

		if (!i.has_value)
			throw FmtRuntimeError("Option --{} takes no value", name);

		return {int(&i - options.data()), inline_value};
	}

	throw FmtRuntimeError("Unknown option: {}", arg);
}

OptionParser::Result
OptionParser::ParseShort(const char *arg)
{
	if (arg[2] == 0)
		for (const auto &i : options)
			if (i.short_option != 0 && i.short_option == arg[1])
				return {int(&i - options.data()), TakeValue(arg, i)};

	throw FmtRuntimeError("Unknown option: {}", arg);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift();
		if (arg[0] != '-' || arg[1] == 0) {
			/* "-" alone is a file name, too */
			remaining.push_back(arg);
			continue;
		}

		return arg[1] == '-'
			? ParseLong(arg)
			: ParseShort(arg);
	}

	return {-1, nullptr};
}
