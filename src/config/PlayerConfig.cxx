// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Lilt Project

#include "PlayerConfig.hxx"
#include "Data.hxx"
#include "Domain.hxx"
#include "pcm/AudioParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

static AudioFormat
GetOutputFormat(const ConfigData &config)
{
	return config.With(ConfigOption::AUDIO_OUTPUT_FORMAT, [](const char *s){
		if (s == nullptr)
			return PlayerConfig::DEFAULT_AUDIO_FORMAT;

		return ParseAudioFormat(s);
	});
}

static std::chrono::milliseconds
GetBufferTime(const ConfigData &config)
{
	std::chrono::milliseconds value{
		config.GetPositive(ConfigOption::AUDIO_BUFFER_TIME,
				   PlayerConfig::DEFAULT_BUFFER_TIME.count()),
	};

	if (value < PlayerConfig::MIN_BUFFER_TIME) {
		FmtWarning(config_domain,
			   "audio_buffer_time {}ms is too small, using {}ms instead",
			   value.count(), PlayerConfig::MIN_BUFFER_TIME.count());
		value = PlayerConfig::MIN_BUFFER_TIME;
	}

	return value;
}

static FloatDuration
GetSeconds(const ConfigData &config, ConfigOption option,
	   FloatDuration default_value)
{
	using std::chrono::duration_cast;
	using std::chrono::steady_clock;

	const auto value =
		config.GetDuration(option, steady_clock::duration::zero(),
				   duration_cast<steady_clock::duration>(default_value));
	return duration_cast<FloatDuration>(value);
}

static CrossFadeSettings
GetCrossFade(const ConfigData &config, FloatDuration max_crossfade)
{
	CrossFadeSettings settings;
	settings.duration = GetSeconds(config, ConfigOption::CROSSFADE,
				       settings.duration);
	if (settings.duration > max_crossfade)
		throw FmtRuntimeError("crossfade {}s exceeds max_crossfade {}s",
				      settings.duration.count(),
				      max_crossfade.count());

	settings.curve = config.With(ConfigOption::CROSSFADE_CURVE, [](const char *s){
		return s != nullptr
			? ParseCrossFadeCurve(s)
			: CrossFadeSettings{}.curve;
	});

	return settings;
}

PlayerConfig::PlayerConfig(const ConfigData &config)
	:audio_format(GetOutputFormat(config)),
	 buffer_time(GetBufferTime(config)),
	 decode_chunk_time(config.GetPositive(ConfigOption::DECODE_CHUNK_TIME,
					      DEFAULT_DECODE_CHUNK_TIME.count())),
	 max_crossfade(GetSeconds(config, ConfigOption::MAX_CROSSFADE,
				  DEFAULT_MAX_CROSSFADE)),
	 corrupt_frame_threshold(config.GetUnsigned(ConfigOption::CORRUPT_FRAME_THRESHOLD,
						    DEFAULT_CORRUPT_FRAME_THRESHOLD)),
	 loop_mode(config.With(ConfigOption::LOOP_MODE, [](const char *s){
		 return s != nullptr
			 ? ParseLoopMode(s)
			 : LoopMode::POINTS;
	 })),
	 volume(config.GetUnsigned(ConfigOption::VOLUME, PCM_VOLUME_1))
{
	cross_fade = GetCrossFade(config, max_crossfade);

	if (volume > PCM_VOLUME_MAX)
		throw FmtRuntimeError("volume {} is out of range (0..{})",
				      volume, PCM_VOLUME_MAX);
}
