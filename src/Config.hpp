#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace Config {
constexpr int kDefaultGridSize = 3;
constexpr int kDefaultTimeLimitSeconds = 15;
constexpr int kSpeedTimeLimitSeconds = 5;
constexpr int kMinTimeLimitSeconds = 5;
constexpr int kMaxTimeLimitSeconds = 30;
constexpr int kFeedbackDwellMs = 1500;
constexpr bool kLogTimerTicks = false;
constexpr int kWindowWidth = 900;
constexpr int kWindowHeight = 900;
constexpr int kFrameDelayMs = 16;
}

#endif
