// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Block.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <algorithm>
#include <exception>

template<typename T>
static T
GetValue(const ConfigBlock &block, std::string_view name, T default_value,
	 T (ConfigParam::*getter)() const)
{
	const auto *param = block.Find(name);
	return param != nullptr
		? (param->*getter)()
		: default_value;
}

const ConfigParam *
ConfigBlock::Find(std::string_view name) const noexcept
{
	const auto i = std::find_if(params.begin(), params.end(),
				    [name](const ConfigParam &p){
					    return p.name == name;
				    });
	if (i == params.end())
		return nullptr;

	i->used = true;
	return &*i;
}

const char *
ConfigBlock::GetString(std::string_view name,
		       const char *default_value) const noexcept
{
	const auto *param = Find(name);
	return param != nullptr
		? param->value.c_str()
		: default_value;
}

unsigned
ConfigBlock::GetUnsigned(std::string_view name, unsigned default_value) const
{
	return GetValue(*this, name, default_value, &ConfigParam::GetUnsigned);
}

unsigned
ConfigBlock::GetPositive(std::string_view name, unsigned default_value) const
{
	return GetValue(*this, name, default_value, &ConfigParam::GetPositive);
}

bool
ConfigBlock::GetBool(std::string_view name, bool default_value) const
{
	return GetValue(*this, name, default_value, &ConfigParam::GetBool);
}

void
ConfigBlock::ThrowWithNested() const
{
	std::throw_with_nested(FmtRuntimeError("Error in block on line {}",
					       line));
}
