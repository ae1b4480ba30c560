// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Param.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>
#include <stdexcept>

void
ConfigParam::ThrowWithNested() const
{
	if (name.empty())
		std::throw_with_nested(FmtRuntimeError("Error on line {}",
						       line));

	std::throw_with_nested(FmtRuntimeError("Error in setting \"{}\" on line {}",
					       name, line));
}

unsigned
ConfigParam::GetUnsigned() const
{
	return With(ParseUnsigned);
}

unsigned
ConfigParam::GetPositive() const
{
	return With(ParsePositive);
}

bool
ConfigParam::GetBool() const
{
	return With(ParseBool);
}

std::chrono::steady_clock::duration
ConfigParam::GetDuration(std::chrono::steady_clock::duration min_value) const
{
	return With([min_value](const char *s){
		const auto value = ParseDuration(s);
		if (value < min_value)
			throw std::runtime_error{"Value is too small"};

		return value;
	});
}
