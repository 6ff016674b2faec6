// include/renewfolio/core/time_series.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/types.hpp"

namespace renewfolio {

/**
 * @brief Immutable hourly series of (timestamp, value) pairs
 *
 * Timestamps are strictly increasing with a fixed one-hour step and every value is
 * finite. Instances are only obtainable through the validating factories, so
 * downstream stages never re-check these properties.
 */
class TimeSeries {
public:
    TimeSeries() = default;

    /**
     * @brief Build a series from explicit timestamps
     * @return INVALID_DATA if lengths differ, spacing is not hourly or a value is not finite
     */
    static Result<TimeSeries> create(std::vector<Timestamp> timestamps,
                                     std::vector<double> values);

    /**
     * @brief Build an hourly series starting at start
     * @return INVALID_DATA if a value is not finite
     */
    static Result<TimeSeries> hourly(Timestamp start, std::vector<double> values);

    size_t size() const {
        return values_.size();
    }
    bool empty() const {
        return values_.empty();
    }

    const std::vector<Timestamp>& timestamps() const {
        return timestamps_;
    }
    const std::vector<double>& values() const {
        return values_;
    }

    double operator[](size_t i) const {
        return values_[i];
    }
    Timestamp timestamp(size_t i) const {
        return timestamps_[i];
    }

    Timestamp start() const {
        return timestamps_.front();
    }
    Timestamp end() const {
        return timestamps_.back();
    }

    /**
     * @brief Sub-series of count values beginning at offset
     * @return INVALID_ARGUMENT if the range exceeds the series
     */
    Result<TimeSeries> slice(size_t offset, size_t count) const;

    /**
     * @brief Same length and identical timestamps
     */
    bool aligned_with(const TimeSeries& other) const {
        return timestamps_ == other.timestamps_;
    }

    /**
     * @brief Copy of this series with each value transformed, re-validated
     */
    template <typename Fn>
    Result<TimeSeries> map(Fn fn) const {
        std::vector<double> out;
        out.reserve(values_.size());
        for (double v : values_) {
            out.push_back(fn(v));
        }
        return create(timestamps_, std::move(out));
    }

private:
    TimeSeries(std::vector<Timestamp> timestamps, std::vector<double> values)
        : timestamps_(std::move(timestamps)), values_(std::move(values)) {}

    std::vector<Timestamp> timestamps_;
    std::vector<double> values_;
};

/**
 * @brief Hourly timestamps start, start + 1h, ...
 */
std::vector<Timestamp> hourly_timestamps(Timestamp start, size_t count);

}  // namespace renewfolio
