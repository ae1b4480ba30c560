// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_DATA_HXX
#define LILT_CONFIG_DATA_HXX

#include "Option.hxx"
#include "Param.hxx"
#include "Block.hxx"

#include <array>
#include <chrono>
#include <optional>
#include <vector>

/**
 * Everything loaded from the configuration file.  An empty
 * instance means "all defaults".
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;
	std::array<std::vector<ConfigBlock>, std::size_t(ConfigBlockOption::MAX)> blocks;

	/**
	 * Set a top-level setting, replacing an earlier value.
	 */
	void SetParam(ConfigOption option, ConfigParam &&param) noexcept {
		params[std::size_t(option)] = std::move(param);
	}

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &param = params[std::size_t(option)];
		return param ? &*param : nullptr;
	}

	/**
	 * Pass the value (nullptr if not configured) to a parser
	 * function.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		const auto *param = GetParam(option);
		return param != nullptr
			? param->With(std::forward<F>(f))
			: f(nullptr);
	}

	unsigned GetUnsigned(ConfigOption option,
			     unsigned default_value) const;

	unsigned GetPositive(ConfigOption option,
			     unsigned default_value) const;

	std::chrono::steady_clock::duration
	GetDuration(ConfigOption option,
		    std::chrono::steady_clock::duration min_value,
		    std::chrono::steady_clock::duration default_value) const;

	ConfigBlock &AddBlock(ConfigBlockOption option, ConfigBlock &&block) {
		return blocks[std::size_t(option)].emplace_back(std::move(block));
	}

	const std::vector<ConfigBlock> &
	GetBlocks(ConfigBlockOption option) const noexcept {
		return blocks[std::size_t(option)];
	}

	[[gnu::pure]]
	const ConfigBlock *GetBlock(ConfigBlockOption option) const noexcept {
		const auto &list = GetBlocks(option);
		return list.empty() ? nullptr : &list.front();
	}

	/**
	 * Find the block whose setting @key equals @value.
	 *
	 * Throws if one of the blocks lacks @key.
	 */
	const ConfigBlock *FindBlock(ConfigBlockOption option,
				     std::string_view key,
				     std::string_view value) const;

	/**
	 * Log a warning about each setting in a claimed block which
	 * nobody has queried; it is probably misspelled.
	 */
	void WarnUnused() const noexcept;
};

#endif
