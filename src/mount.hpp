#pragma once

#include <vector>

#include "stage.hpp"

enum class EMountAction {
    MakeTarget,
    Mount,
    Bind,
    Remount,
    Propagate,
    Move,
};

/* One mount(2) call or mount point creation */
struct TMountAction {
    EMountAction Action;
    TPath Source;
    TPath Target;
    std::string Type;
    uint64_t Flags = 0;
    std::string Data;

    TMountAction(EMountAction action, const TPath &source, const TPath &target,
                 const std::string &type = "", uint64_t flags = 0,
                 const std::string &data = "") :
        Action(action), Source(source), Target(target), Type(type),
        Flags(flags), Data(data) {}

    std::string ToString() const;
};

std::vector<TMountAction> PlanMount(const TMountSpec &spec);
TError ApplyMountAction(TKernel &kernel, const TMountAction &action);
