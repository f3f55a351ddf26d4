// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "log/ILogManager.hpp"

// First argument is an ILogManager pointer (raw or shared). Null disables logging.
#define VRIG_LOG(lm, ...)        do { if (lm) (lm)->log(__VA_ARGS__); } while (0)
#define VRIG_LOG_INFO(lm, ...)   do { if (lm) (lm)->log("[INFO] " __VA_ARGS__); } while (0)
#define VRIG_LOG_WARN(lm, ...)   do { if (lm) (lm)->log("[WARN] " __VA_ARGS__); } while (0)
#define VRIG_LOG_ERROR(lm, ...)  do { if (lm) (lm)->log("[ERROR] " __VA_ARGS__); } while (0)
