// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_EXCEPTION_HXX
#define LILT_EXCEPTION_HXX

#include <exception>
#include <string>

/**
 * Walk down the std::nested_exception chain and return the first
 * exception of type @T, or nullptr.  The pointer is valid as long as
 * @ep is.
 */
template<typename T>
[[gnu::pure]]
const T *
FindNested(std::exception_ptr ep) noexcept
{
	while (ep) {
		try {
			std::rethrow_exception(ep);
		} catch (const T &t) {
			return &t;
		} catch (const std::nested_exception &ne) {
			ep = ne.nested_ptr();
			continue;
		} catch (...) {
		}

		break;
	}

	return nullptr;
}

/**
 * Join the messages of an exception and all exceptions nested in it
 * into one line, outermost first, separated by "; ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

#endif
