// Implementation of the diagnostic trace hook.

#include "core/trace_log.h"

#include <cstdarg>
#include <cstdio>
#include <utility>

namespace shapesound {

namespace {

bool g_trace_enabled = false;
TraceSink g_trace_sink;

}  // namespace

void setTraceEnabled(bool enabled) { g_trace_enabled = enabled; }

bool traceEnabled() { return g_trace_enabled; }

void setTraceSink(TraceSink sink) { g_trace_sink = std::move(sink); }

void trace(const char* tag, const char* fmt, ...) {
  if (!g_trace_enabled) return;

  char buffer[512];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);

  if (g_trace_sink) {
    g_trace_sink(tag, std::string(buffer));
  } else {
    std::fprintf(stderr, "[%s] %s\n", tag, buffer);
  }
}

}  // namespace shapesound
