// Implementation of breakpoint automation.

#include "synth/synthesis_event.h"

#include <cmath>

namespace shapesound {

AutomationProgram AutomationProgram::constant(float value) {
  AutomationProgram program;
  program.initial = value;
  return program;
}

AutomationProgram& AutomationProgram::setAt(double offset, float value) {
  if (points.empty() && offset <= 0.0) {
    initial = value;
  } else {
    points.push_back({offset, value, RampType::Set});
  }
  return *this;
}

AutomationProgram& AutomationProgram::linearTo(double offset, float value) {
  points.push_back({offset, value, RampType::Linear});
  return *this;
}

AutomationProgram& AutomationProgram::exponentialTo(double offset, float value) {
  points.push_back({offset, value, RampType::Exponential});
  return *this;
}

float AutomationProgram::valueAt(double offset) const {
  double prev_offset = 0.0;
  float prev_value = initial;

  for (const auto& point : points) {
    if (offset < point.offset) {
      double span = point.offset - prev_offset;
      if (span <= 0.0) return prev_value;
      double frac = (offset - prev_offset) / span;
      if (frac < 0.0) frac = 0.0;

      switch (point.ramp) {
        case RampType::Set:
          return prev_value;
        case RampType::Linear:
          return prev_value + static_cast<float>(frac) * (point.value - prev_value);
        case RampType::Exponential:
          if (prev_value <= 0.0f || point.value <= 0.0f) return prev_value;
          return prev_value *
                 static_cast<float>(std::pow(static_cast<double>(point.value / prev_value), frac));
      }
      return prev_value;
    }
    prev_offset = point.offset;
    prev_value = point.value;
  }

  return prev_value;
}

double AutomationProgram::lastOffset() const {
  return points.empty() ? 0.0 : points.back().offset;
}

}  // namespace shapesound
