#pragma once

#include "util/error.hpp"

extern "C" {
#include <signal.h>
}

TError Signal(int signum, void (*handler)(int));
TError ResetBlockedSignals();
