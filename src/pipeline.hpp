#pragma once

#include "stage.hpp"

/* Builds the sandbox and executes argv in it, returns only on failure */
TError RunSandbox(const TValidatedConfig &config, TKernel &kernel, const TTuple &argv);

/* Same, but validates config before any kernel call */
TError RunSandbox(const TSandboxConfig &config, TKernel &kernel, const TTuple &argv);

/* command line arguments, or configured command, or default shell */
TTuple SandboxCommand(const TSandboxConfig &config, const TTuple &args);

int SandboxExitCode(const TError &error);
