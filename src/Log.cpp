#include"Log.hpp"
#include"BurnScarExceptions.hpp"
#include<spdlog/sinks/stdout_color_sinks.h>

namespace burnscar {

	std::shared_ptr<spdlog::logger> logger()
	{
		static std::mutex mut;
		std::scoped_lock<std::mutex> lock{ mut };
		std::shared_ptr<spdlog::logger> out = spdlog::get("burnscar");
		if (!out) {
			out = spdlog::stderr_color_mt("burnscar");
			out->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
		}
		return out;
	}

	void setLogLevel(const std::string& level)
	{
		spdlog::level::level_enum lvl = spdlog::level::from_str(level);
		//from_str maps anything it doesn't recognize to off
		if (lvl == spdlog::level::off && level != "off") {
			throw InvalidConfigurationException("Unknown log level: " + level);
		}
		logger()->set_level(lvl);
	}
}
