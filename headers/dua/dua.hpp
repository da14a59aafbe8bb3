//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef DUA_DUA_HPP
#define DUA_DUA_HPP

/**
 * @file dua.hpp
 * @brief Main header for the Declaration Usage Analyzer library.
 *
 * This header provides convenient access to the core types, the program
 * model loader, configuration and the analyzers. Include specific headers
 * for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config/config.hpp"
#include "frontend/program.hpp"
#include "frontend/program_loader.hpp"
#include "analyzers/all_analyzers.hpp"

#endif //DUA_DUA_HPP
