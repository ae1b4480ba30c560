// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_CONFIG_PARAM_HXX
#define LILT_CONFIG_PARAM_HXX

#include <chrono>
#include <concepts>
#include <string>
#include <string_view>

/**
 * One "name value" setting, either at the top level of the
 * configuration file or inside a block.
 */
struct ConfigParam {
	/**
	 * Empty for top-level settings; those are identified by
	 * their #ConfigOption.
	 */
	std::string name;

	std::string value;

	/**
	 * The line in the configuration file; -1 if the setting was
	 * synthesized.
	 */
	int line;

	/**
	 * Set when somebody has queried the value.
	 */
	mutable bool used = false;

	ConfigParam(std::string_view _name, std::string_view _value,
		    int _line=-1)
		:name(_name), value(_value), line(_line) {}

	/**
	 * Call this in a "catch" block to throw a nested exception
	 * naming the location of this setting.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	/**
	 * Pass the value to a parser function; exceptions thrown by
	 * it get the location of this setting attached.
	 */
	template<std::regular_invocable<const char *> F>
	auto With(F &&f) const {
		used = true;

		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}

	unsigned GetUnsigned() const;

	unsigned GetPositive() const;

	bool GetBool() const;

	/**
	 * Throws if the duration is shorter than @min_value.
	 */
	std::chrono::steady_clock::duration
	GetDuration(std::chrono::steady_clock::duration min_value) const;
};

#endif
