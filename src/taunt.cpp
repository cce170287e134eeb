#include <drvsim/taunt.hpp>
#include <array>

namespace drvsim {

namespace {
const std::array<const char*, 15> kTaunts = {
  "Learn how to drive!",
  "Nice driving, grandma!",
  "Did you get your license from a cereal box?",
  "Sunday driver alert!",
  "Is this your first time?",
  "The gas pedal is on the right!",
  "Speed limit's just a suggestion!",
  "Move it or lose it!",
  "You drive like my neighbor!",
  "Beep beep! Coming through!",
  "Are we there yet?",
  "I've seen snails go faster!",
  "Driving school dropout?",
  "Born to be mild!",
  "Wake me when we get there...",
};
} // namespace

TauntTimer::TauntTimer(const DriveTuning& tuning, std::mt19937& rng)
  : tuning_(tuning), rng_(rng) {
  reset();
}

std::size_t TauntTimer::taunt_count() { return kTaunts.size(); }

double TauntTimer::draw_delay_() {
  std::uniform_real_distribution<double> U(tuning_.taunt_min_s, tuning_.taunt_max_s);
  return U(rng_);
}

void TauntTimer::reset() {
  current_.reset();
  show_remaining_ = 0.0;
  next_in_ = draw_delay_();
}

std::optional<std::string> TauntTimer::update(double dt) {
  if (!(dt > 0.0)) return std::nullopt;

  if (current_) {
    show_remaining_ -= dt;
    if (show_remaining_ <= 0.0) {
      current_.reset();
      show_remaining_ = 0.0;
    }
    return std::nullopt;
  }

  next_in_ -= dt;
  if (next_in_ > 0.0) return std::nullopt;

  std::uniform_int_distribution<std::size_t> pick(0, kTaunts.size() - 1);
  current_ = std::string(kTaunts[pick(rng_)]);
  show_remaining_ = tuning_.taunt_show_s;
  next_in_ = draw_delay_();
  return current_;
}

} // namespace drvsim
