#pragma once
#include <cstdlib>

namespace tinyc {

// Feature flags sourced from environment (TINYC_TRACE, TINYC_DIAG_JSON)
inline bool env_flag_enabled(const char *name)
{
    const char *v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

inline bool trace_enabled() { return env_flag_enabled("TINYC_TRACE"); }
inline bool diag_json_enabled() { return env_flag_enabled("TINYC_DIAG_JSON"); }

} // namespace tinyc
