// SPDX-License-Identifier: MIT
/**
 * @file valuation_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the fairvalue library
 *
 * Probes compile to single NOP instructions until a tracing tool attaches.
 * They are the library's only diagnostic channel: validation failures, sweep
 * progress and per-cell failures are observable without rebuilding.
 *
 * Example usage with bpftrace:
 *   # Every rejected input, with the module and error code
 *   sudo bpftrace -e 'usdt:./lib*.so:fairvalue:validation_error {
 *       printf("module=%d code=%d value=%f\n", arg0, arg1, arg2); }'
 *
 *   # Invalid cells of every sensitivity sweep
 *   sudo bpftrace -e 'usdt:./lib*.so:fairvalue:sweep_cell_invalid { ... }'
 */

#ifndef FAIRVALUE_VALUATION_TRACE_H
#define FAIRVALUE_VALUATION_TRACE_H

#include <stddef.h>

/**
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
 * Provider name for all fairvalue probes
 */
#define FAIRVALUE_PROVIDER fairvalue

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define FAIRVALUE_MODULE_PROJECTION      1
#define FAIRVALUE_MODULE_DISCOUNTING     2
#define FAIRVALUE_MODULE_AGGREGATION     3
#define FAIRVALUE_MODULE_SENSITIVITY     4
#define FAIRVALUE_MODULE_COST_OF_CAPITAL 5
#define FAIRVALUE_MODULE_GROWTH          6
#define FAIRVALUE_MODULE_SEGMENTS        7
#define FAIRVALUE_MODULE_DCF_MODEL       8
#define FAIRVALUE_MODULE_EXPORT          9

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (FAIRVALUE_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., horizon, rows)
 * @param param2: Module-specific parameter (e.g., base revenue, discount rate)
 * @param param3: Module-specific parameter
 */
#define FAIRVALUE_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(FAIRVALUE_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param count: Work items completed (periods, cells)
 * @param final_metric: Headline result (enterprise value, per-share value)
 */
#define FAIRVALUE_TRACE_ALGO_COMPLETE(module_id, count, final_metric) \
    DTRACE_PROBE3(FAIRVALUE_PROVIDER, algo_complete, module_id, count, final_metric)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValuationErrorCode as int
 * @param value: Offending value
 * @param index: Period or cell index
 */
#define FAIRVALUE_TRACE_VALIDATION_ERROR(module_id, error_code, value, index) \
    DTRACE_PROBE4(FAIRVALUE_PROVIDER, validation_error, module_id, error_code, value, index)

/**
 * ============================================================================
 * Module-Specific Probes: Sensitivity Sweep
 * ============================================================================
 */

/**
 * Fired when a sweep cell is recorded as invalid
 * @param row: Discount-rate axis index
 * @param col: Terminal-growth axis index
 * @param discount_rate: Discount rate of the cell
 * @param terminal_growth: Terminal growth rate of the cell
 * @param error_code: ValuationErrorCode as int
 */
#define FAIRVALUE_TRACE_SWEEP_CELL_INVALID(row, col, discount_rate, terminal_growth, error_code) \
    DTRACE_PROBE5(FAIRVALUE_PROVIDER, sweep_cell_invalid, \
                  row, col, discount_rate, terminal_growth, error_code)

/**
 * Fired when a sweep finishes
 * @param rows: Discount-rate axis size
 * @param cols: Terminal-growth axis size
 * @param failed: Number of invalid cells
 */
#define FAIRVALUE_TRACE_SWEEP_COMPLETE(rows, cols, failed) \
    DTRACE_PROBE4(FAIRVALUE_PROVIDER, sweep_complete, \
                  FAIRVALUE_MODULE_SENSITIVITY, rows, cols, failed)

#endif // FAIRVALUE_VALUATION_TRACE_H
