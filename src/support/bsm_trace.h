// SPDX-License-Identifier: MIT
/**
 * @file bsm_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the bsm library
 *
 * The library never writes to stdout/stderr. These probes are the only
 * diagnostic channel and can be enabled at runtime with bpftrace, systemtap
 * or perf. When tracing is disabled (default), probes compile to NOPs.
 *
 * Example usage with bpftrace:
 *   # Watch every rejected input
 *   sudo bpftrace -e 'usdt:./lib*.so:bsm:validation_error { printf("%d %d\n", arg0, arg1); }'
 *
 *   # Time heat map sweeps
 *   sudo bpftrace -e 'usdt:./lib*.so:bsm:sweep_start { @s[tid] = nsecs; }
 *                     usdt:./lib*.so:bsm:sweep_complete { @ns = hist(nsecs - @s[tid]); }'
 */

#ifndef BSM_TRACE_H
#define BSM_TRACE_H

#include <stddef.h>

/**
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all bsm library probes
 */
#define BSM_PROVIDER bsm

/**
 * Module identifiers passed as the first parameter to shared probes
 */
#define BSM_MODULE_VALIDATION   1
#define BSM_MODULE_PRICER       2
#define BSM_MODULE_HEATMAP      3
#define BSM_MODULE_PAYOFF       4

/**
 * Fired when an input is rejected
 * @param module_id: Module identifier (BSM_MODULE_* constant)
 * @param error_code: ValidationErrorCode as int
 * @param value: Offending value
 * @param index: Grid index (0 when not applicable)
 */
#define BSM_TRACE_VALIDATION_ERROR(module_id, error_code, value, index) \
    DTRACE_PROBE4(BSM_PROVIDER, validation_error, module_id, error_code, value, index)

/**
 * Fired when a pricer is constructed for a snapshot
 * @param spot, strike, maturity, volatility: Snapshot fields
 */
#define BSM_TRACE_PRICER_CREATE(spot, strike, maturity, volatility) \
    DTRACE_PROBE4(BSM_PROVIDER, pricer_create, spot, strike, maturity, volatility)

/**
 * Fired when a sweep begins
 * @param module_id: BSM_MODULE_HEATMAP or BSM_MODULE_PAYOFF
 * @param n_rows: Number of rows (1 for a payoff curve)
 * @param n_cols: Number of columns
 */
#define BSM_TRACE_SWEEP_START(module_id, n_rows, n_cols) \
    DTRACE_PROBE3(BSM_PROVIDER, sweep_start, module_id, n_rows, n_cols)

/**
 * Fired when a sweep finishes
 * @param module_id: BSM_MODULE_HEATMAP or BSM_MODULE_PAYOFF
 * @param n_cells: Cells evaluated
 * @param failed_count: Cells whose snapshot was rejected
 */
#define BSM_TRACE_SWEEP_COMPLETE(module_id, n_cells, failed_count) \
    DTRACE_PROBE3(BSM_PROVIDER, sweep_complete, module_id, n_cells, failed_count)

#endif // BSM_TRACE_H
