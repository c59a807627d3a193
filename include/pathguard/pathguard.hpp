#pragma once

/**
 * @file pathguard.hpp
 * @brief Umbrella header for the pathguard library
 */

#define PATHGUARD_VERSION_MAJOR 1
#define PATHGUARD_VERSION_MINOR 0
#define PATHGUARD_VERSION_PATCH 0

#ifndef PATHGUARD_VERSION
#define PATHGUARD_VERSION "1.0.0"
#endif

#include "pathguard/allowed_checker.hpp"
#include "pathguard/case_manager.hpp"
#include "pathguard/config.hpp"
#include "pathguard/depth_protector.hpp"
#include "pathguard/errors.hpp"
#include "pathguard/file_collector.hpp"
#include "pathguard/normalization.hpp"
#include "pathguard/path_policy.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/safe_join.hpp"
#include "pathguard/security_manager.hpp"
#include "pathguard/symlink_resolver.hpp"
#include "pathguard/windows_paths.hpp"
