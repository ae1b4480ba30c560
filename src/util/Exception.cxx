// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Exception.hxx"

/**
 * Append a message; line breaks and runs of whitespace become one
 * space.
 */
static void
AppendOneLine(std::string &dest, const char *src) noexcept
{
	bool pending_space = false;
	for (; *src != 0; ++src) {
		const char ch = *src;
		if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
			pending_space = true;
			continue;
		}

		if (pending_space && !dest.empty() && dest.back() != ' ')
			dest.push_back(' ');

		pending_space = false;
		dest.push_back(ch);
	}
}

static void
AppendSeparator(std::string &dest) noexcept
{
	if (!dest.empty())
		dest += "; ";
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;

	while (ep) {
		try {
			std::rethrow_exception(ep);
		} catch (const std::exception &e) {
			AppendSeparator(result);
			AppendOneLine(result, e.what());

			const auto *ne = dynamic_cast<const std::nested_exception *>(&e);
			ep = ne != nullptr ? ne->nested_ptr() : nullptr;
		} catch (const std::nested_exception &ne) {
			ep = ne.nested_ptr();
		} catch (...) {
			AppendSeparator(result);
			result += "Unknown exception";
			break;
		}
	}

	return result;
}
