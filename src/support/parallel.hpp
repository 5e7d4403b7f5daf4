#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for portability across OpenMP and sequential execution
 *
 * Usage:
 *   BSM_PRAGMA_PARALLEL
 *   {
 *       BSM_PRAGMA_FOR_COLLAPSE2
 *       for (size_t i = 0; i < rows; ++i)
 *           for (size_t j = 0; j < cols; ++j) { ... }
 *   }
 */

#if defined(_OPENMP)
    #define BSM_PRAGMA_SIMD                           _Pragma("omp simd")
    #define BSM_PRAGMA_PARALLEL_FOR                   _Pragma("omp parallel for")
    #define BSM_PRAGMA_PARALLEL                       _Pragma("omp parallel")
    #define BSM_PRAGMA_FOR                            _Pragma("omp for")
    #define BSM_PRAGMA_FOR_STATIC                     _Pragma("omp for schedule(static)")
    #define BSM_PRAGMA_FOR_COLLAPSE2                  _Pragma("omp for collapse(2) schedule(static)")
    #define BSM_PRAGMA_ATOMIC                         _Pragma("omp atomic")
    #define BSM_PRAGMA_CRITICAL                       _Pragma("omp critical")
#else
    // Sequential execution (no parallelization)
    #define BSM_PRAGMA_SIMD
    #define BSM_PRAGMA_PARALLEL_FOR
    #define BSM_PRAGMA_PARALLEL
    #define BSM_PRAGMA_FOR
    #define BSM_PRAGMA_FOR_STATIC
    #define BSM_PRAGMA_FOR_COLLAPSE2
    #define BSM_PRAGMA_ATOMIC
    #define BSM_PRAGMA_CRITICAL
#endif

/**
 * Design notes:
 *
 * 1. OpenMP: `#pragma omp parallel for` for multi-threading and `#pragma omp simd`
 *    for vectorization. Sweep cells are independent, so static scheduling is used.
 *
 * 2. Sequential: No-op when the build has no OpenMP support.
 *
 * 3. _Pragma is used instead of #pragma so the pragmas can live inside macros.
 */
