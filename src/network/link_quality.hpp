#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace astv::network {

/**
 * LinkQualityEstimator - rolling average of recent success rates.
 *
 * Keeps the last `window` samples (percent, 0-100). An empty window reports
 * 100 so that the first reading after a reconnect starts optimistic.
 */
class LinkQualityEstimator {
public:
    static constexpr std::size_t DEFAULT_WINDOW = 5;
    static constexpr float EMPTY_STRENGTH = 100.0f;

    explicit LinkQualityEstimator(std::size_t window = DEFAULT_WINDOW);

    /**
     * Record a sample and return the new average.
     *
     * Samples only count while the link is connected; otherwise the window
     * is left untouched and 0 is returned.
     */
    float observe(float success_rate_percent, bool connected);

    void reset();

    [[nodiscard]] float average() const;
    [[nodiscard]] std::size_t size() const { return samples_.size(); }
    [[nodiscard]] std::size_t window() const { return window_; }
    [[nodiscard]] std::vector<float> samples() const;

private:
    std::size_t window_;
    std::deque<float> samples_;
};

} // namespace astv::network
