// Diagnostic trace hook. Disabled by default; writes "[Tag] message" lines.

#ifndef SHAPESOUND_CORE_TRACE_LOG_H
#define SHAPESOUND_CORE_TRACE_LOG_H

#include <functional>
#include <string>

namespace shapesound {

/// @brief Receiver for trace lines. The default sink prints to stderr.
using TraceSink = std::function<void(const char* tag, const std::string& message)>;

/// @brief Enable or disable tracing globally.
void setTraceEnabled(bool enabled);

/// @brief Whether trace lines are currently emitted.
bool traceEnabled();

/// @brief Replace the trace sink. Passing an empty function restores stderr.
void setTraceSink(TraceSink sink);

/// @brief Emit a printf-formatted trace line under `tag` when tracing is on.
/// @param tag Short component tag, e.g. "Angularity".
/// @param fmt printf format string.
void trace(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace shapesound

#endif  // SHAPESOUND_CORE_TRACE_LOG_H
