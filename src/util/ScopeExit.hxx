// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#ifndef LILT_SCOPE_EXIT_HXX
#define LILT_SCOPE_EXIT_HXX

#include <utility>

template<typename F>
class ScopeExitGuard {
	F function;

public:
	explicit ScopeExitGuard(F &&f) noexcept
		:function(std::move(f)) {}

	~ScopeExitGuard() noexcept {
		function();
	}

	ScopeExitGuard(const ScopeExitGuard &) = delete;
	ScopeExitGuard &operator=(const ScopeExitGuard &) = delete;
};

struct ScopeExitTag {
	template<typename F>
	ScopeExitGuard<F> operator+(F &&f) const noexcept {
		return ScopeExitGuard<F>(std::move(f));
	}
};

#define LILT_SCOPE_EXIT_NAME2(line) at_scope_exit_ ## line
#define LILT_SCOPE_EXIT_NAME(line) LILT_SCOPE_EXIT_NAME2(line)

/**
 * Run the following block when leaving the current scope:
 *
 *   AtScopeExit(&file) { fclose(file); };
 *
 * The macro arguments are the lambda's captures.
 */
#define AtScopeExit(...) \
	const auto LILT_SCOPE_EXIT_NAME(__LINE__) = ScopeExitTag{} + [__VA_ARGS__]()

#endif
