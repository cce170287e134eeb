#pragma once
#include <optional>
#include <random>
#include <string>
#include <drvsim/tuning.hpp>

namespace drvsim {

// Cosmetic comic-text scheduler. Shows one taunt at a time, then re-arms.
class TauntTimer {
public:
  TauntTimer(const DriveTuning& tuning, std::mt19937& rng);

  void reset();

  // Returns the taunt when one was just shown.
  std::optional<std::string> update(double dt);

  const std::optional<std::string>& current() const { return current_; }
  double next_in() const { return next_in_; }
  double show_remaining() const { return show_remaining_; }

  static std::size_t taunt_count();

private:
  double draw_delay_();

  const DriveTuning& tuning_;
  std::mt19937& rng_;
  std::optional<std::string> current_;
  double next_in_{0.0};
  double show_remaining_{0.0};
};

} // namespace drvsim
