// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * stage_timer.hpp
 *
 * Scoped wall-clock timer that logs a stage's duration on exit.
 */

#ifndef HYDRODEM_COMMON_STAGE_TIMER_HPP
#define HYDRODEM_COMMON_STAGE_TIMER_HPP

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

namespace hydrodem {

class StageTimer {
 public:
  using Clock = std::chrono::steady_clock;

  explicit StageTimer(std::string label)
      : label_(std::move(label)), start_(Clock::now()) {}

  ~StageTimer() {
    const double ms = elapsedMs();
    if (ms < 1000.0) {
      spdlog::info("[Workflow] {} took {:.1f} ms", label_, ms);
    } else {
      spdlog::info("[Workflow] {} took {:.2f} s", label_, ms / 1000.0);
    }
  }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

  double elapsedMs() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start_)
        .count();
  }

 private:
  std::string label_;
  Clock::time_point start_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_COMMON_STAGE_TIMER_HPP
