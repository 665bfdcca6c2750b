#pragma once
/**
 * @file ckv_bounded.hpp
 * @brief Layer 2 umbrella header: the bounded-value runtime.
 *
 * Pulls in Layer 1 (ckv_base.hpp) and every public bounded header: limits, behaviors,
 * the checked arithmetic engine, HardClamp, SoftClamp, guards, validators, views, the
 * capability concepts and the nlohmann_json integration.
 */
#include "ckv_base.hpp"

#include "bounded/arithmetic.hpp"
#include "bounded/behavior.hpp"
#include "bounded/capabilities.hpp"
#include "bounded/error.hpp"
#include "bounded/guard.hpp"
#include "bounded/hard_clamp.hpp"
#include "bounded/json.hpp"
#include "bounded/lease.hpp"
#include "bounded/limits.hpp"
#include "bounded/parse.hpp"
#include "bounded/random_source.hpp"
#include "bounded/soft_clamp.hpp"
#include "bounded/validator.hpp"
#include "bounded/view.hpp"
#include "bounded/wide_int.hpp"
