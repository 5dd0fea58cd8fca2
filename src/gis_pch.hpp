#pragma once
#ifndef hm_gis_pch_h
#define hm_gis_pch_h

#include<algorithm>
#include<array>
#include<chrono>
#include<cmath>
#include<cstdint>
#include<cstdio>
#include<filesystem>
#include<fstream>
#include<functional>
#include<iomanip>
#include<iostream>
#include<limits>
#include<map>
#include<memory>
#include<mutex>
#include<numeric>
#include<optional>
#include<random>
#include<set>
#include<sstream>
#include<stdexcept>
#include<string>
#include<thread>
#include<type_traits>
#include<unordered_map>
#include<unordered_set>
#include<variant>
#include<vector>

#include<gdal_priv.h>
#include<ogrsf_frmts.h>
#include<ogr_spatialref.h>
#include<cpl_conv.h>

#include<proj.h>

#include<xtl/xoptional.hpp>
#include<xtl/xoptional_sequence.hpp>

#include<spdlog/spdlog.h>

#endif
