#pragma once
#ifndef bs_log_h
#define bs_log_h

#include"bs_pch.hpp"

namespace burnscar {

	//the shared "burnscar" logger, created on first use with a colored stderr sink
	std::shared_ptr<spdlog::logger> logger();

	//accepts spdlog's level names: trace, debug, info, warn, err, critical, off
	//throws InvalidConfigurationException for anything else
	void setLogLevel(const std::string& level);
}

#endif
