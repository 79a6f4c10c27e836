module;

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#endif

export module keystone.core.log;

import keystone.core.config;
import std;

export namespace keystone::log
{
	enum class Level
	{
		Trace,
		Debug,
		Info,
		Warn,
		Error,
		Critical,
		Off
	};

	constexpr std::optional<Level> level_from_string(std::string_view name)
	{
		constexpr std::array<std::pair<std::string_view, Level>, 7> names =
		{{
			{"trace", Level::Trace},
			{"debug", Level::Debug},
			{"info", Level::Info},
			{"warn", Level::Warn},
			{"error", Level::Error},
			{"critical", Level::Critical},
			{"off", Level::Off}
		}};

		for(const auto& [n, level] : names)
		{
			if(n == name)
				return level;
		}

		return std::nullopt;
	}
}

namespace keystone::log
{
	constexpr std::string_view logger_name = "keystone";

	constexpr spdlog::level::level_enum to_spdlog(Level level)
	{
		switch(level)
		{
		using enum Level;
		case Trace:
			return spdlog::level::trace;
		case Debug:
			return spdlog::level::debug;
		case Info:
			return spdlog::level::info;
		case Warn:
			return spdlog::level::warn;
		case Error:
			return spdlog::level::err;
		case Critical:
			return spdlog::level::critical;
		case Off:
		default:
			return spdlog::level::off;
		}
	}
}

export namespace keystone::log
{
	void init(Level level)
	{
		auto console = spdlog::get(std::string{logger_name});
		if(!console)
			console = spdlog::stdout_color_mt(std::string{logger_name});

		console->set_pattern("[%t][%^%l%$] %v");
		console->set_level(to_spdlog(level));

		spdlog::set_default_logger(console);
	}

	// level comes from KEYSTONE_LOG_LEVEL at configure time
	void init()
	{
		init(level_from_string(config::default_log_level).value_or(Level::Info));
	}

	using spdlog::trace;
	using spdlog::debug;
	using spdlog::info;
	using spdlog::warn;
	using spdlog::error;
	using spdlog::critical;
}
