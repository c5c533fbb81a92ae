// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macro for OpenMP and sequential execution
 *
 * Usage:
 *   MONOCURVE_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t k = 0; k < n_restarts; ++k) { ... }
 *
 * Dynamic schedule, one iteration per chunk: optimizer restarts have very
 * different costs. Annotated loops must not depend on iteration order;
 * every iteration writes only its own output slot.
 */

#if defined(_OPENMP)
    #define MONOCURVE_PRAGMA_PARALLEL_FOR_DYNAMIC       _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    #define MONOCURVE_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif
