// SPDX-License-Identifier: MIT
/**
 * @file volbatch_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the volbatch library
 *
 * Tracing points for the batch harness and the surface pipeline that can be
 * enabled at runtime with bpftrace, systemtap or perf. When tracing is not
 * attached each probe is a single NOP.
 *
 * Example usage with bpftrace:
 *   # Watch per-ticker job lifecycle
 *   sudo bpftrace -e 'usdt:./volbatch_batch:volbatch:job_* { printf("%s %d\n", probe, arg0); }'
 *
 *   # Report every abandoned job
 *   sudo bpftrace -e 'usdt:./volbatch_batch:volbatch:job_timeout { printf("job %d after %d ms\n", arg0, arg1); }'
 */

#ifndef VOLBATCH_TRACE_H
#define VOLBATCH_TRACE_H

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
#endif

/**
 * Provider name for all volbatch probes
 */
#define VOLBATCH_PROVIDER volbatch

/**
 * Module identifiers passed as the first argument of shared probes
 */
#define VOLBATCH_MODULE_BATCH_RUNNER    1
#define VOLBATCH_MODULE_TICKER_JOB      2
#define VOLBATCH_MODULE_RESHAPER        3
#define VOLBATCH_MODULE_REPORT          4
#define VOLBATCH_MODULE_OUTPUT          5

/**
 * ============================================================================
 * Batch Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a batch starts
 * @param n_jobs: Number of submitted tickers
 * @param timeout_ms: Per-job wall-clock budget
 * @param concurrency: Maximum number of jobs in flight
 */
#define VOLBATCH_TRACE_BATCH_START(n_jobs, timeout_ms, concurrency) \
    DTRACE_PROBE3(VOLBATCH_PROVIDER, batch_start, n_jobs, timeout_ms, concurrency)

/**
 * Fired when every job has reported
 * @param n_jobs: Number of outcome entries
 * @param n_failed: Number of failed entries (any failure tag)
 * @param elapsed_ms: Total wall time
 */
#define VOLBATCH_TRACE_BATCH_COMPLETE(n_jobs, n_failed, elapsed_ms) \
    DTRACE_PROBE3(VOLBATCH_PROVIDER, batch_complete, n_jobs, n_failed, elapsed_ms)

/**
 * ============================================================================
 * Job Probes
 * ============================================================================
 */

/**
 * Fired when a job is launched
 * @param index: Submission index of the ticker
 */
#define VOLBATCH_TRACE_JOB_START(index) \
    DTRACE_PROBE1(VOLBATCH_PROVIDER, job_start, index)

/**
 * Fired when a job produced a result
 * @param index: Submission index
 * @param elapsed_ms: Job wall time
 */
#define VOLBATCH_TRACE_JOB_COMPLETE(index, elapsed_ms) \
    DTRACE_PROBE2(VOLBATCH_PROVIDER, job_complete, index, elapsed_ms)

/**
 * Fired when a job reported a typed failure
 * @param module_id: Module that classified the failure
 * @param failure_code: JobFailureCode as integer
 */
#define VOLBATCH_TRACE_JOB_FAILED(module_id, failure_code) \
    DTRACE_PROBE2(VOLBATCH_PROVIDER, job_failed, module_id, failure_code)

/**
 * Fired when a job exhausted its budget and was abandoned
 * @param index: Submission index
 * @param elapsed_ms: Time waited before abandoning
 */
#define VOLBATCH_TRACE_JOB_TIMEOUT(index, elapsed_ms) \
    DTRACE_PROBE2(VOLBATCH_PROVIDER, job_timeout, index, elapsed_ms)

/**
 * ============================================================================
 * Pipeline Probes
 * ============================================================================
 */

/**
 * Fired after a surface was reshaped into a skew grid
 * @param n_points: Raw points consumed
 * @param n_kept: Points that landed in a grid cell
 * @param n_buckets: Tenor buckets in the grid
 */
#define VOLBATCH_TRACE_RESHAPE_COMPLETE(n_points, n_kept, n_buckets) \
    DTRACE_PROBE3(VOLBATCH_PROVIDER, reshape_complete, n_points, n_kept, n_buckets)

/**
 * Fired when a ticker document was persisted
 * @param n_bytes: Size of the written document
 */
#define VOLBATCH_TRACE_FILE_WRITTEN(n_bytes) \
    DTRACE_PROBE1(VOLBATCH_PROVIDER, file_written, n_bytes)

#endif  // VOLBATCH_TRACE_H
