// Central options validation and key=value builder
#pragma once

#include <string>
#include "cardiowatch_core.h"

// Returns false if options are invalid. On failure, sets err_code (stable code)
// and err_msg (short reason). On success, err_code/msg are untouched.
// Validation only, no mutation.
extern "C" bool cw_validate_options(const cardiowatch::MonitorOptions& opt,
                                    const char** err_code,
                                    std::string* err_msg);

// Build options from `key=value` lines (blank lines and '#' comments ignored).
// Keys are the MonitorOptions field names, profile fields as `profile.<name>`.
// Unset keys keep their defaults. The result is validated; on error `ok` is
// false and code/msg are set.
cardiowatch::MonitorOptions cw_build_options_from_kv(const std::string& text,
                                                     bool* ok,
                                                     const char** err_code,
                                                     std::string* err_msg);
