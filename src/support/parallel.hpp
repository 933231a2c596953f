#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Usage:
 *   KUMQUAT_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 *   KUMQUAT_PRAGMA_PARALLEL
 *   {
 *       KUMQUAT_PRAGMA_FOR_COLLAPSE2
 *       for (size_t i = 0; i < n; ++i)
 *           for (size_t j = 0; j < m; ++j) { ... }
 *   }
 */

#if defined(_OPENMP)
    #define KUMQUAT_PRAGMA_PARALLEL_FOR         _Pragma("omp parallel for")
    #define KUMQUAT_PRAGMA_PARALLEL             _Pragma("omp parallel")
    #define KUMQUAT_PRAGMA_FOR_COLLAPSE2        _Pragma("omp for collapse(2)")
#else
    // Sequential execution (no parallelization)
    #define KUMQUAT_PRAGMA_PARALLEL_FOR
    #define KUMQUAT_PRAGMA_PARALLEL
    #define KUMQUAT_PRAGMA_FOR_COLLAPSE2
#endif

/**
 * Design notes:
 *
 * 1. Loops under these macros must not return early or propagate errors.
 *    Validate inputs before entering the parallel region.
 *
 * 2. _Pragma is used instead of #pragma so the directives can live inside
 *    macro definitions.
 */
