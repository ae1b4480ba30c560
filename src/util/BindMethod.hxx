// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_BIND_METHOD_HXX
#define LILT_BIND_METHOD_HXX

#include <type_traits>

/**
 * A "void() noexcept" method bound to an object.  Unlike
 * std::function, it never allocates; the object must outlive it.
 */
class BoundMethod {
	using Function = void (*)(void *instance) noexcept;

	void *instance;
	Function function;

public:
	constexpr BoundMethod(void *_instance, Function _function) noexcept
		:instance(_instance), function(_function) {}

	void operator()() const noexcept {
		function(instance);
	}
};

template<auto method, typename T>
constexpr BoundMethod
BindMethod(T &instance) noexcept
{
	return {&instance, [](void *p) noexcept {
		(static_cast<T *>(p)->*method)();
	}};
}

/**
 * Bind a method of the current object, e.g.
 * Thread thread{BIND_THIS_METHOD(Run)}.
 */
#define BIND_THIS_METHOD(method) \
	BindMethod<&std::remove_reference_t<decltype(*this)>::method>(*this)

#endif
