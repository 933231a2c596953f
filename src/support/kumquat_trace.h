// SPDX-License-Identifier: MIT
/**
 * @file kumquat_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the kumquat library
 *
 * The library never writes log text. Observability comes from static probes
 * that can be enabled at runtime with bpftrace, systemtap or perf.
 *
 * When tracing is disabled (default), probes compile to nothing.
 *
 * Example usage with bpftrace:
 *   # Count validation failures per module
 *   sudo bpftrace -e 'usdt:./lib*.so:kumquat:validation_error { @[arg0] = count(); }'
 *
 *   # Watch implied volatility convergence
 *   sudo bpftrace -e 'usdt:./lib*.so:kumquat:iv_complete { printf("%d\n", arg1); }'
 */

#ifndef KUMQUAT_TRACE_H
#define KUMQUAT_TRACE_H

#include <stddef.h>

/**
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h.
 * Otherwise, define no-op macros.
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
 * Provider name for all kumquat probes
 */
#define KUMQUAT_PROVIDER kumquat

/**
 * Module identifiers, passed as the first parameter to the generic probes
 */
#define MODULE_PRICER           1
#define MODULE_GREEKS           2
#define MODULE_IMPLIED_VOL      3
#define MODULE_ROOT_FINDING     4
#define MODULE_VOLATILITY       5
#define MODULE_PROBABILITY      6
#define MODULE_CHAIN            7
#define MODULE_STRATEGY         8
#define MODULE_SURFACE          9

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., row count, max_iter)
 * @param param2: Module-specific parameter
 * @param param3: Module-specific parameter
 */
#define KUMQUAT_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(KUMQUAT_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Work items or iterations completed
 * @param final_metric: Final metric value
 */
#define KUMQUAT_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(KUMQUAT_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Validation Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode / VolatilityErrorCode as int
 * @param param1: Offending value
 * @param param2: Index or threshold
 */
#define KUMQUAT_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(KUMQUAT_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Convergence Probes
 * ============================================================================
 */

/**
 * Fired on each root-finder iteration
 * @param module_id: Module identifier
 * @param iter: Iteration number
 * @param x: Current point
 * @param fx: Function value at x
 */
#define KUMQUAT_TRACE_CONVERGENCE_ITER(module_id, iter, x, fx) \
    DTRACE_PROBE4(KUMQUAT_PROVIDER, convergence_iter, module_id, iter, x, fx)

/**
 * Fired when a root finder gives up
 * @param module_id: Module identifier
 * @param iterations: Iterations performed
 * @param final_error: Residual at failure
 */
#define KUMQUAT_TRACE_CONVERGENCE_FAILED(module_id, iterations, final_error) \
    DTRACE_PROBE3(KUMQUAT_PROVIDER, convergence_failed, module_id, iterations, final_error)

/**
 * ============================================================================
 * Module-Specific Probes: Implied Volatility
 * ============================================================================
 */

/**
 * Fired when IV calculation begins
 * @param spot: Spot price
 * @param strike: Strike price
 * @param days: Days to expiry
 * @param market_price: Market price
 */
#define KUMQUAT_TRACE_IV_START(spot, strike, days, market_price) \
    DTRACE_PROBE4(KUMQUAT_PROVIDER, iv_start, spot, strike, days, market_price)

/**
 * Fired when IV calculation completes
 * @param implied_vol: Calculated implied volatility
 * @param iterations: Number of iterations
 * @param converged: 1 if converged, 0 if failed
 */
#define KUMQUAT_TRACE_IV_COMPLETE(implied_vol, iterations, converged) \
    DTRACE_PROBE3(KUMQUAT_PROVIDER, iv_complete, implied_vol, iterations, converged)

#endif // KUMQUAT_TRACE_H
