#include "pc/interaction/Haptics.hpp"

namespace pc {

int hapticDurationMs(HapticStyle style) {
  switch (style) {
    case HapticStyle::Light: return 10;
    case HapticStyle::Medium: return 20;
    case HapticStyle::Heavy: return 30;
  }
  return 10;
}

bool triggerHaptic(HapticDriver* driver, HapticStyle style) {
  if (!driver) return false;
  driver->vibrate(hapticDurationMs(style));
  return true;
}

} // namespace pc
