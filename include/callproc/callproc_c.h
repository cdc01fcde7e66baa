#ifndef CALLPROC_C_H
#define CALLPROC_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*==============================================================================
 * Status codes
 *============================================================================*/
#define CALLPROC_OK                0
#define CALLPROC_ERR              -1
#define CALLPROC_ERR_INVALID_ARG  -2
#define CALLPROC_ERR_ALLOC        -4
#define CALLPROC_ERR_PARSE        -5

/*==============================================================================
 * Opaque handles
 *============================================================================*/
typedef struct callproc_config_t callproc_config_t;
typedef struct callproc_processor_t callproc_processor_t;

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

/** Initialize the library. Call once at process start. */
int callproc_init(void);

/** Free a heap-allocated string returned by callproc_* functions. */
void callproc_free_string(char* str);

/*==============================================================================
 * Config API
 *============================================================================*/

/**
 * Parse a ProcessorConfig from environment variable format string.
 * Format: KEY=value lines, e.g. DTMF_VALIDATION_ENABLED=true.
 * Returns CALLPROC_OK on success, writes to *out.
 */
int callproc_config_from_env_string(const char* env_content, callproc_config_t** out);

/**
 * Serialize a ProcessorConfig to environment variable format string.
 * Caller must free returned string with callproc_free_string().
 */
int callproc_config_to_env_string(const callproc_config_t* cfg, char** out);

/** Free a config handle. */
void callproc_config_destroy(callproc_config_t* cfg);

/*==============================================================================
 * Processor API
 *============================================================================*/

/**
 * Create a processor with the default handlers and an in-process session
 * store. cfg may be NULL for defaults.
 */
int callproc_processor_create(const callproc_config_t* cfg, callproc_processor_t** out);

/** Free a processor handle (waits for outstanding notifications). */
void callproc_processor_destroy(callproc_processor_t* proc);

/**
 * Process a provider callback body (JSON array of events or one event).
 * @param header_call_id Value of the x-ms-call-connection-id header, or NULL
 * @param summary_json   Output: {status, processed, failed, ...}.
 *                       Caller must free with callproc_free_string().
 */
int callproc_process_webhook(callproc_processor_t* proc,
                             const char* body,
                             const char* header_call_id,
                             char** summary_json);

/**
 * Process one internally-synthesized event (e.g. "V1.Call.Initiated").
 * @param data_json JSON object merged into the event data, or NULL
 */
int callproc_process_api_event(callproc_processor_t* proc,
                               const char* event_type,
                               const char* call_id,
                               const char* data_json,
                               char** summary_json);

/** Active call ids as a JSON array. Caller must free with callproc_free_string(). */
int callproc_get_active_calls(const callproc_processor_t* proc, char** out_json);

/** Processor statistics as a JSON object. Caller must free with callproc_free_string(). */
int callproc_get_stats(const callproc_processor_t* proc, char** out_json);

/**
 * DTMF validation gate for a call.
 * Returns 1 when open (or when the state cannot be read), 0 when closed,
 * negative status code on invalid arguments.
 */
int callproc_is_gate_open(callproc_processor_t* proc, const char* call_id);

/**
 * Block until DTMF validation completes for a call or timeout_ms elapses.
 * Returns 1 on completion, 0 on timeout or error, negative status code on
 * invalid arguments.
 */
int callproc_wait_for_validation(callproc_processor_t* proc, const char* call_id, int timeout_ms);

#ifdef __cplusplus
}
#endif

#endif /* CALLPROC_C_H */
