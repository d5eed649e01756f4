#include "network/link_quality.hpp"

#include <algorithm>
#include <numeric>

namespace astv::network {

LinkQualityEstimator::LinkQualityEstimator(std::size_t window)
    : window_(std::max<std::size_t>(window, 1))
{
}

float LinkQualityEstimator::observe(float success_rate_percent, bool connected) {
    if (!connected) {
        return 0.0f;
    }

    samples_.push_back(std::clamp(success_rate_percent, 0.0f, 100.0f));
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    return average();
}

void LinkQualityEstimator::reset() {
    samples_.clear();
}

float LinkQualityEstimator::average() const {
    if (samples_.empty()) {
        return EMPTY_STRENGTH;
    }
    const float sum = std::accumulate(samples_.begin(), samples_.end(), 0.0f);
    return sum / static_cast<float>(samples_.size());
}

std::vector<float> LinkQualityEstimator::samples() const {
    return {samples_.begin(), samples_.end()};
}

} // namespace astv::network
