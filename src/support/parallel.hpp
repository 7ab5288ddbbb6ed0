// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief OpenMP pragma wrappers for the sensitivity sweep
 *
 * Usage:
 *   FAIRVALUE_PRAGMA_PARALLEL_IF(cells >= threshold)
 *   {
 *       FAIRVALUE_PRAGMA_FOR_COLLAPSE2
 *       for (size_t i = 0; i < m; ++i)
 *           for (size_t j = 0; j < n; ++j) { ... }
 *   }
 *
 * Without OpenMP every macro expands to nothing and loops run serially.
 */

#define FAIRVALUE_DO_PRAGMA(x) _Pragma(#x)

#if defined(_OPENMP)
    #define FAIRVALUE_PRAGMA_PARALLEL_IF(cond)      FAIRVALUE_DO_PRAGMA(omp parallel if(cond))
    #define FAIRVALUE_PRAGMA_FOR_COLLAPSE2          _Pragma("omp for collapse(2)")
#else
    #define FAIRVALUE_PRAGMA_PARALLEL_IF(cond)
    #define FAIRVALUE_PRAGMA_FOR_COLLAPSE2
#endif
