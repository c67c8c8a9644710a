#pragma once
#include <span>
#include "BeatHistory.hpp"

/**
 * @brief Robust BPM from beat timestamps.
 *
 * Intervals outside the IQR fences are dropped before averaging, independent
 * of any filtering already applied upstream.
 *
 * @param beat_timestamps Ordered beat times in seconds.
 * @param iqr_multiplier Fence factor.
 * @return 60 / mean(kept intervals), or 0 when fewer than 2 beats or nothing survives.
 */
double calculate_bpm(std::span<const double> beat_timestamps, double iqr_multiplier = 1.5);

double calculate_bpm(const BeatHistory& history, double iqr_multiplier = 1.5);
