// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_BLOCK_HXX
#define LILT_CONFIG_BLOCK_HXX

#include "Param.hxx"

#include <string_view>
#include <vector>

/**
 * A "name { ... }" block; plugins read their settings from one.
 */
struct ConfigBlock {
	/**
	 * The line of the opening brace; -1 for an empty block
	 * standing in for a missing one.
	 */
	int line;

	std::vector<ConfigParam> params;

	/**
	 * Set when a plugin has claimed this block.  Settings of
	 * unclaimed blocks are not checked by
	 * ConfigData::WarnUnused().
	 */
	mutable bool used = false;

	explicit ConfigBlock(int _line=-1) noexcept
		:line(_line) {}

	bool IsEmpty() const noexcept {
		return params.empty();
	}

	void SetUsed() const noexcept {
		used = true;
	}

	void AddParam(std::string_view name, std::string_view value,
		      int param_line=-1) {
		params.emplace_back(name, value, param_line);
	}

	/**
	 * Look up a setting and mark it as used.
	 */
	[[gnu::pure]]
	const ConfigParam *Find(std::string_view name) const noexcept;

	[[gnu::pure]]
	const char *GetString(std::string_view name,
			      const char *default_value=nullptr) const noexcept;

	unsigned GetUnsigned(std::string_view name,
			     unsigned default_value) const;

	unsigned GetPositive(std::string_view name,
			     unsigned default_value) const;

	bool GetBool(std::string_view name, bool default_value) const;

	/**
	 * Call this in a "catch" block to throw a nested exception
	 * naming the location of this block.
	 */
	[[noreturn]]
	void ThrowWithNested() const;
};

#endif
