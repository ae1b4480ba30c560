// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "Open.hxx"
#include "DecoderPlugin.hxx"
#include "Stream.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "system/Error.hxx"
#include "Log.hxx"

#include <string_view>

#include <errno.h>
#include <unistd.h>

/**
 * Returns the file name suffix without the dot, or an empty string.
 */
[[gnu::pure]]
static std::string_view
GetFilenameSuffix(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	const std::string_view name = slash != path.npos
		? path.substr(slash + 1)
		: path;

	const auto dot = name.rfind('.');
	if (dot == name.npos || dot == 0)
		return {};

	return name.substr(dot + 1);
}

static std::unique_ptr<DecoderStream>
TryPlugin(const DecoderPlugin &plugin, const char *path)
{
	FmtDebug(decoder_domain, "probing plugin {}", plugin.name);

	try {
		return plugin.OpenFile(path);
	} catch (const OpenError &) {
		throw;
	} catch (...) {
		std::throw_with_nested(OpenError::Corrupt(path, plugin.name));
	}
}

std::unique_ptr<DecoderStream>
DecoderOpenFile(const DecoderPluginList &plugins, const char *path)
{
	if (access(path, R_OK) < 0) {
		const int e = errno;
		try {
			throw MakeErrno(e, "Failed to access file");
		} catch (...) {
			std::throw_with_nested(OpenError::NotFound(path));
		}
	}

	const auto suffix = GetFilenameSuffix(path);

	if (!suffix.empty()) {
		for (const auto *plugin : plugins) {
			if (!plugin->SupportsSuffix(suffix))
				continue;

			auto stream = TryPlugin(*plugin, path);
			if (stream)
				return stream;
		}
	}

	/* no plugin claims this suffix (or none of them was able to
	   open the file); let the others have a look */
	for (const auto *plugin : plugins) {
		if (!suffix.empty() && plugin->SupportsSuffix(suffix))
			continue;

		auto stream = TryPlugin(*plugin, path);
		if (stream)
			return stream;
	}

	throw OpenError::UnsupportedFormat(path);
}
