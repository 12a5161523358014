#pragma once

#include "stage.hpp"

/* single entry mapping id to itself, or nothing */
bool IsSelfMap(const TIdMap &map, uint32_t id);

/* newuidmap/newgidmap command line */
TTuple IdMapHelperCommand(const TPath &binary, pid_t pid, const TIdMap &map);
