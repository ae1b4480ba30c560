// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Data.hxx"
#include "Domain.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

unsigned
ConfigData::GetUnsigned(ConfigOption option, unsigned default_value) const
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->GetUnsigned()
		: default_value;
}

unsigned
ConfigData::GetPositive(ConfigOption option, unsigned default_value) const
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->GetPositive()
		: default_value;
}

std::chrono::steady_clock::duration
ConfigData::GetDuration(ConfigOption option,
			std::chrono::steady_clock::duration min_value,
			std::chrono::steady_clock::duration default_value) const
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->GetDuration(min_value)
		: default_value;
}

const ConfigBlock *
ConfigData::FindBlock(ConfigBlockOption option,
		      std::string_view key, std::string_view value) const
{
	for (const auto &block : GetBlocks(option)) {
		const char *found = block.GetString(key);
		if (found == nullptr)
			throw FmtRuntimeError("Block on line {} has no \"{}\"",
					      block.line, key);

		if (value == found)
			return &block;
	}

	return nullptr;
}

void
ConfigData::WarnUnused() const noexcept
{
	for (const auto &list : blocks) {
		for (const auto &block : list) {
			/* an unclaimed block may belong to a plugin
			   which was disabled at compile time */
			if (!block.used)
				continue;

			for (const auto &param : block.params)
				if (!param.used)
					FmtWarning(config_domain,
						   "Unknown setting \"{}\" on line {}",
						   param.name, param.line);
		}
	}
}
