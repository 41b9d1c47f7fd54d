#pragma once
/**
 * @file dlk_service.hpp
 * @brief Layer 2: Service modules built on dlk_base.
 *
 * Provides lifecycle management, logging, the filesystem layer, the directory lock itself
 * and its JSON configuration. Include this from applications and tests.
 */
#include "dlk_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/lock_filesystem.hpp"
#include "utils/dir_lock.hpp"
#include "utils/lock_config.hpp"
