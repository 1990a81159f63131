#pragma once

/**
 * @file latbench.hpp
 * @brief Umbrella header for the latbench library
 *
 * The version string comes from the build (LATBENCH_VERSION).
 */

#include "latbench/agent.hpp"
#include "latbench/config.hpp"
#include "latbench/digest.hpp"
#include "latbench/docker_sandbox.hpp"
#include "latbench/executor.hpp"
#include "latbench/harvest.hpp"
#include "latbench/payload.hpp"
#include "latbench/platform.hpp"
#include "latbench/process.hpp"
#include "latbench/result.hpp"
#include "latbench/sandbox.hpp"
#include "latbench/setup.hpp"
#include "latbench/types.hpp"
#include "latbench/warnings.hpp"

#ifndef LATBENCH_VERSION
#define LATBENCH_VERSION "0.0.0-dev"
#endif
