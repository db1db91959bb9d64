#ifndef SHIKENMATRIX_H
#define SHIKENMATRIX_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(__GNUC__)
#define SM_API __attribute__((visibility("default")))
#else
#define SM_API
#endif

/* ==========================================================================
 * ShikenMatrix reporter - C boundary
 * ==========================================================================
 * Every string handed out by the library (SmConfig fields, SmStatus
 * last_error) is owned by the caller afterwards and must be released with
 * sm_config_free / sm_string_free. Strings passed in are copied.
 *
 * Window and media callbacks run on the reporter's capture thread. The log
 * callback may be called from any reporter thread, including the thread
 * calling into this API, but never from two threads at once. Pointers
 * passed to a callback are valid only for the duration of the call. No
 * window or media callback starts after sm_reporter_stop returns.
 * ========================================================================== */

typedef enum SmLogLevel {
    SM_LOG_INFO = 0,
    SM_LOG_WARNING = 1,
    SM_LOG_ERROR = 2
} SmLogLevel;

typedef struct SmConfig {
    bool enabled;
    char* ws_url;   /* may be null */
    char* token;    /* may be null */
    bool enable_media_reporting;
} SmConfig;

/* Opaque; never dereferenced */
typedef struct SmReporter SmReporter;

typedef struct SmStatus {
    bool is_running;
    bool is_connected;
    char* last_error; /* null when no error; free with sm_string_free */
} SmStatus;

typedef void (*SmLogCallback)(SmLogLevel level, const char* message, uintptr_t user_data);

typedef void (*SmWindowDataCallback)(const char* title,
                                     const char* process_name,
                                     uint32_t pid,
                                     const uint8_t* icon_data,
                                     uintptr_t icon_size,
                                     uintptr_t user_data);

typedef void (*SmMediaDataCallback)(const char* title,
                                    const char* artist,
                                    const char* album,
                                    double duration,
                                    double elapsed_time,
                                    bool playing,
                                    const uint8_t* artwork_data,
                                    uintptr_t artwork_size,
                                    uintptr_t user_data);

/* ---------- Permissions ---------- */

SM_API bool sm_check_accessibility_permission(void);

/* May show a system prompt and block the calling thread */
SM_API bool sm_request_accessibility_permission(void);

/* Bounded probe of the media API; false once it was found blocked */
SM_API bool sm_check_media_permission(void);

/* Clears the sticky "blocked" verdict and its persisted marker */
SM_API void sm_reset_media_permission_check(void);

/* ---------- Configuration ---------- */

/* Never null unless out of memory; defaults when nothing is stored */
SM_API SmConfig* sm_config_load(void);

SM_API bool sm_config_save(const SmConfig* config);

/* Safe with null */
SM_API void sm_config_free(SmConfig* config);

/* Safe with null */
SM_API void sm_string_free(char* s);

/* ---------- Reporter ---------- */

/* Null when config is null or invalid, or a reporter is already running */
SM_API SmReporter* sm_reporter_start(const SmConfig* config);

/* False when the handle does not name the running reporter.
 * Capture shutdown is bounded by the stop grace period. Closing the
 * connection waits for the network thread, which cannot be interrupted
 * while it resolves the endpoint's host name, so stop can take as long as
 * a slow DNS lookup. */
SM_API bool sm_reporter_stop(SmReporter* handle);

/* Reports process-wide state; the handle may be null */
SM_API SmStatus sm_reporter_get_status(const SmReporter* handle);

SM_API bool sm_reporter_is_running(void);

/* ---------- Callbacks (null clears the slot) ---------- */

SM_API void sm_reporter_set_log_callback(SmLogCallback callback, uintptr_t user_data);
SM_API void sm_reporter_set_window_callback(SmWindowDataCallback callback, uintptr_t user_data);
SM_API void sm_reporter_set_media_callback(SmMediaDataCallback callback, uintptr_t user_data);

#ifdef __cplusplus
}
#endif

#endif /* SHIKENMATRIX_H */
