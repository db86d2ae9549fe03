#pragma once
#ifndef bs_pch_h
#define bs_pch_h

#include<algorithm>
#include<array>
#include<cctype>
#include<chrono>
#include<cmath>
#include<cstdio>
#include<cstdint>
#include<filesystem>
#include<functional>
#include<limits>
#include<memory>
#include<mutex>
#include<optional>
#include<ostream>
#include<stdexcept>
#include<string>
#include<thread>
#include<type_traits>
#include<unordered_map>
#include<utility>
#include<vector>

#include<gdal_priv.h>
#include<ogrsf_frmts.h>
#include<proj.h>
#include<xtl/xoptional.hpp>
#include<xtl/xoptional_sequence.hpp>
#include<spdlog/spdlog.h>

#include"BurnScarTypeDefs.hpp"

#endif
