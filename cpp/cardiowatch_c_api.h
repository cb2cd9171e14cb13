// Plain C bridge over MonitorEngine and the assessment pipeline.
// Engines are addressed by 32-bit handles; 0 is never a valid handle.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "cardiowatch_core.h"

#define CW_OK 0
#define CW_ERR_INVALID_ARGUMENT (-6)
#define CW_ERR_INVALID_HANDLE (-101)

namespace cardiowatch {
// Compact JSON rendering of an assessment (ostringstream based)
std::string assessmentToJson(const Assessment& a);
}

extern "C" {
    // Returns 0 when options are invalid (see cw_validate_options)
    uint32_t cw_engine_create(const cardiowatch::MonitorOptions* opt);
    // mode: 0 resting, 1 exercise. Returns 0 rejected, 1 accepted,
    // 2 accepted and a notification was raised, or a negative error.
    int      cw_engine_push(uint32_t h, double value, double timestamp, int mode);
    // Periodic evaluation at `now`. Returns 1 evaluated, 0 not enough data,
    // or a negative error. score_out may be null.
    int      cw_engine_tick(uint32_t h, double now, double* score_out);
    // Zone / AlertStatus as their integer values, or a negative error
    int      cw_engine_zone(uint32_t h);
    int      cw_engine_alert_status(uint32_t h);
    int      cw_engine_size(uint32_t h, size_t* recent, size_t* window);
    // Runs the full assessment over the engine's feature window with the
    // given ancillary values and writes JSON into out (NUL terminated).
    // Returns the JSON length (excluding NUL) or a negative error; a result
    // >= cap means the output was truncated. CW_ERR_INVALID_ARGUMENT when the
    // window holds fewer than minAssessmentSamples samples.
    int      cw_engine_assess(uint32_t h, double timestamp, double hrv, double respiratoryRate,
                              double activity, double sleepRatio, char* out, size_t cap);
    int      cw_engine_destroy(uint32_t h);

    // Stateless pipeline over a heart-rate series. Out-of-range values are
    // skipped; CW_ERR_INVALID_ARGUMENT when fewer than 5 valid values remain.
    int      cw_assess(const double* heartRates, size_t n, double timestamp, double hrv,
                       double respiratoryRate, double activity, double sleepRatio,
                       char* out, size_t cap);

    // Stable code for a negative return ("CARDIOWATCH_E101", ...), "" for >= 0
    const char* cw_error_code(int rc);
}
