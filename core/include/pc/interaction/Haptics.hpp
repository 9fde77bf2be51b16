#pragma once
#include <cstdint>

namespace pc {

enum class HapticStyle : std::uint8_t {
  Light,
  Medium,
  Heavy
};

inline const char* toString(HapticStyle s) {
  switch (s) {
    case HapticStyle::Light: return "light";
    case HapticStyle::Medium: return "medium";
    case HapticStyle::Heavy: return "heavy";
  }
  return "unknown";
}

// Pulse length in milliseconds: 10 / 20 / 30.
int hapticDurationMs(HapticStyle style);

// Device vibration, supplied by the host when the platform has one.
class HapticDriver {
public:
  virtual ~HapticDriver() = default;
  virtual void vibrate(int durationMs) = 0;
};

// No-op without a driver. Returns whether a pulse was issued.
bool triggerHaptic(HapticDriver* driver, HapticStyle style = HapticStyle::Light);

} // namespace pc
