// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_UTIL_OPTIONPARSER_HXX
#define LILT_UTIL_OPTIONPARSER_HXX

#include "OptionDef.hxx"

#include <span>
#include <vector>

/**
 * Walks through the command line, one option at a time.  Options
 * and file names may be mixed.
 */
class OptionParser {
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, const char *const*_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1) {}

	struct Result {
		int index;
		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parses the next option.  Non-option arguments are
	 * collected for GetRemaining().
	 *
	 * Throws on error.
	 *
	 * @return the option index into the definition array, or a
	 * negative index when the command line is exhausted
	 */
	Result Next();

	/**
	 * Returns the remaining non-option arguments.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	const char *Shift() noexcept {
		const char *arg = args.front();
		args = args.subspan(1);
		return arg;
	}

	/**
	 * Consume the value of an option which expects one.
	 *
	 * @return nullptr if the option has no value
	 */
	const char *TakeValue(const char *arg, const OptionDef &option);

	Result ParseLong(const char *arg);
	Result ParseShort(const char *arg);
};

#endif
