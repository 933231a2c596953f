/**
 * @file simple.hpp
 * @brief Umbrella header for kumquat::simple namespace
 */

#pragma once

#include "src/simple/analytics.hpp"
