#pragma once

#include <string>
#include <vector>

#include "common.hpp"
#include "util/path.hpp"

#include "config.pb.h"

extern cfg::TConfig &config();

/* candidates in priority order, first existing wins */
std::vector<TPath> ConfigSearchPath();

/* explicit path must exist, without it absent config is empty */
TError ReadConfig(const TPath &path);
TError ReadConfigs(TPath &found);

TError ParseConfig(const std::string &text, cfg::TConfig &cfg);
