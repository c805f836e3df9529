#include "gsnake_speed.hpp"

#include <cmath>

#include "../common/gsnake_pref.h"

namespace gsnake {

int TickDelay::next(int length) noexcept {
  if (!frozen()) {
    delay_ms_ = static_cast<int>(std::floor(
        starting_ms_ * std::pow(GSNAKE_DELAY_MODIFIER, length)));
  }
  return delay_ms_;
}

}  // namespace gsnake
