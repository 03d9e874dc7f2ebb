//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_DSV_HPP
#define DEPSIEVE_DSV_HPP

/**
 * @file dsv.hpp
 * @brief Main header for the depsieve library.
 *
 * This header provides convenient access to the core types and the
 * analysis entry points. Include this header for general usage, or include
 * specific headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"

#include "analysis/analysis_engine.hpp"
#include "analysis/report.hpp"
#include "core/config.hpp"
#include "manifest/workspace_resolver.hpp"

#endif //DEPSIEVE_DSV_HPP
