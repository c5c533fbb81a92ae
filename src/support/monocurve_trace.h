// SPDX-License-Identifier: MIT
/**
 * @file monocurve_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for monocurve
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When tracing is disabled (default), probes
 * compile to single NOP instructions.
 *
 * Example usage with bpftrace:
 *   # Watch every optimizer run
 *   sudo bpftrace -e 'usdt:./lib*.so:monocurve:optimizer_complete { ... }'
 *
 *   # Report fits that hit the iteration cap
 *   sudo bpftrace -e 'usdt:./lib*.so:monocurve:convergence_failed { ... }'
 */

#ifndef MONOCURVE_TRACE_H
#define MONOCURVE_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all monocurve probes
 */
#define MONOCURVE_PROVIDER monocurve

/**
 * Module identifiers, passed as the first parameter to shared probes
 */
#define MODULE_ISPLINE_BASIS   1
#define MODULE_MONOTONE_FIT    2
#define MODULE_LBFGS           3
#define MODULE_TWO_FACTOR      4
#define MODULE_ENTITY          5
#define MODULE_SERIALIZATION   6

/**
 * Two-factor calibration stage identifiers
 */
#define CALIBRATION_STAGE_VALIDATE        1
#define CALIBRATION_STAGE_DISCRETE_FIT    2
#define CALIBRATION_STAGE_CENTER          3
#define CALIBRATION_STAGE_CURVE_FIT       4
#define CALIBRATION_STAGE_REANCHOR        5
#define CALIBRATION_STAGE_DIAGNOSTICS     6

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific size (e.g., samples, cells)
 * @param param2: Module-specific size (e.g., basis functions, levels)
 * @param param3: Module-specific parameter
 */
#define MONOCURVE_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(MONOCURVE_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Iterations or restarts completed
 * @param final_metric: Final metric value (objective, RMSE)
 */
#define MONOCURVE_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(MONOCURVE_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * Fired when a two-factor calibration enters a new stage
 * @param stage: Stage identifier (CALIBRATION_STAGE_*)
 * @param param: Stage-specific value (cells, levels, iterations)
 */
#define MONOCURVE_TRACE_CALIBRATION_STAGE(stage, param) \
    DTRACE_PROBE2(MONOCURVE_PROVIDER, calibration_stage, stage, param)

/**
 * ============================================================================
 * Optimizer Probes
 * ============================================================================
 */

/**
 * Fired when an L-BFGS run starts
 * @param n_params: Dimension of the search space
 * @param max_iter: Iteration cap
 * @param f0: Objective at the starting point
 */
#define MONOCURVE_TRACE_OPTIMIZER_START(n_params, max_iter, f0) \
    DTRACE_PROBE3(MONOCURVE_PROVIDER, optimizer_start, n_params, max_iter, f0)

/**
 * Fired after each accepted L-BFGS step
 * @param iter: Iteration number
 * @param f: Objective value
 * @param grad_norm: Infinity norm of the gradient
 * @param step: Accepted line-search step length
 */
#define MONOCURVE_TRACE_OPTIMIZER_ITER(iter, f, grad_norm, step) \
    DTRACE_PROBE4(MONOCURVE_PROVIDER, optimizer_iter, iter, f, grad_norm, step)

/**
 * Fired when an L-BFGS run terminates
 * @param iterations: Iterations performed
 * @param f: Final objective value
 * @param converged: 1 if a tolerance was met, 0 otherwise
 */
#define MONOCURVE_TRACE_OPTIMIZER_COMPLETE(iterations, f, converged) \
    DTRACE_PROBE3(MONOCURVE_PROVIDER, optimizer_complete, iterations, f, converged)

/**
 * Fired after each multi-start restart of the monotone fitter
 * @param restart: Restart index (0 = unperturbed start)
 * @param objective: Objective reached by this restart
 * @param iterations: Iterations used by this restart
 */
#define MONOCURVE_TRACE_FIT_RESTART(restart, objective, iterations) \
    DTRACE_PROBE3(MONOCURVE_PROVIDER, fit_restart, restart, objective, iterations)

/**
 * ============================================================================
 * Convergence and Validation Probes
 * ============================================================================
 */

/**
 * Fired when an optimization finishes without meeting its tolerances.
 * The result is still used; this is the warning channel.
 * @param module_id: Module identifier
 * @param step: Outer step (restart index, factor index, 0 if unused)
 * @param iterations: Iterations performed
 * @param final_metric: Objective at termination
 */
#define MONOCURVE_TRACE_CONVERGENCE_FAILED(module_id, step, iterations, final_metric) \
    DTRACE_PROBE4(MONOCURVE_PROVIDER, convergence_failed, module_id, step, iterations, final_metric)

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Error code (ValidationErrorCode or ConfigErrorCode)
 * @param index: Offending sample or cell index
 * @param value: Offending value
 */
#define MONOCURVE_TRACE_VALIDATION_ERROR(module_id, error_code, index, value) \
    DTRACE_PROBE4(MONOCURVE_PROVIDER, validation_error, module_id, error_code, index, value)

/**
 * Fired when a monotonicity check fails beyond tolerance
 * @param module_id: Module identifier
 * @param grid_index: First grid index with a decrease
 * @param decrease: Size of the decrease (negative)
 */
#define MONOCURVE_TRACE_MONOTONICITY_VIOLATION(module_id, grid_index, decrease) \
    DTRACE_PROBE3(MONOCURVE_PROVIDER, monotonicity_violation, module_id, grid_index, decrease)

#endif  // MONOCURVE_TRACE_H
