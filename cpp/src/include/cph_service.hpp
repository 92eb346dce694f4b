#pragma once
/**
 * @file cph_service.hpp
 * @brief Layer 2: Service modules built on cph_base.
 *
 * Provides the asynchronous, command-queue logger and its sinks.
 * Include this when you need Logger or the LOGGER_* macros.
 */
#include "cph_base.hpp"

#include "utils/logger.hpp"
