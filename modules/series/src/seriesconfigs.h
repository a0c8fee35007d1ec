#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <tChrono/Epoch>

#include "tc_series_global.h"
#include "timeseries.h"

namespace tc {

struct TC_SERIES_API SeriesConfigs
{
    Epoch start{};
    Epoch end{};
    Duration step{};
    Boundary boundary = Boundary::Exclusive;
    bool reverse = false;
    int logVerbosity = 0;

    /// @throw std::invalid_argument if the step does not fit the boundaries.
    TimeSeries createSeries() const;

    // The configs are left untouched on failure.
    static bool load(const std::string& filename, SeriesConfigs& configs);
    static bool loadJson(const nlohmann::json& json, SeriesConfigs& configs);
};

// nlohmann::json interface
TC_SERIES_API void to_json(nlohmann::json& json, const SeriesConfigs& configs);
TC_SERIES_API void from_json(const nlohmann::json& json,
                             SeriesConfigs& configs);

} // namespace tc
