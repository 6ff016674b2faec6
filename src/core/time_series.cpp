// src/core/time_series.cpp

#include "renewfolio/core/time_series.hpp"
#include <cmath>
#include <string>
#include "renewfolio/core/time_utils.hpp"

namespace renewfolio {

std::vector<Timestamp> hourly_timestamps(Timestamp start, size_t count) {
    std::vector<Timestamp> timestamps;
    timestamps.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        timestamps.push_back(start + SERIES_STEP * static_cast<long>(i));
    }
    return timestamps;
}

Result<TimeSeries> TimeSeries::create(std::vector<Timestamp> timestamps,
                                      std::vector<double> values) {
    if (timestamps.size() != values.size()) {
        return make_error<TimeSeries>(ErrorCode::INVALID_DATA,
                                      "Timestamp count " + std::to_string(timestamps.size()) +
                                          " differs from value count " +
                                          std::to_string(values.size()),
                                      "TimeSeries");
    }

    for (size_t i = 1; i < timestamps.size(); ++i) {
        if (timestamps[i] - timestamps[i - 1] != SERIES_STEP) {
            return make_error<TimeSeries>(
                ErrorCode::INVALID_DATA,
                "Series is not contiguous hourly at " +
                    core::format_utc_timestamp(timestamps[i]) + " (index " +
                    std::to_string(i) + ")",
                "TimeSeries");
        }
    }

    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            return make_error<TimeSeries>(ErrorCode::INVALID_DATA,
                                          "Non-finite value at index " + std::to_string(i),
                                          "TimeSeries");
        }
    }

    return TimeSeries(std::move(timestamps), std::move(values));
}

Result<TimeSeries> TimeSeries::hourly(Timestamp start, std::vector<double> values) {
    auto timestamps = hourly_timestamps(start, values.size());
    return create(std::move(timestamps), std::move(values));
}

Result<TimeSeries> TimeSeries::slice(size_t offset, size_t count) const {
    if (offset + count > values_.size()) {
        return make_error<TimeSeries>(ErrorCode::INVALID_ARGUMENT,
                                      "Slice [" + std::to_string(offset) + ", " +
                                          std::to_string(offset + count) +
                                          ") exceeds series length " +
                                          std::to_string(values_.size()),
                                      "TimeSeries");
    }
    std::vector<Timestamp> ts(timestamps_.begin() + offset,
                              timestamps_.begin() + offset + count);
    std::vector<double> vals(values_.begin() + offset, values_.begin() + offset + count);
    return TimeSeries(std::move(ts), std::move(vals));
}

}  // namespace renewfolio
