#include "seriesconfigs.h"

#include <fstream>
#include <stdexcept>

#include <glog/logging.h>
#include <magic_enum/magic_enum.hpp>

#include <tChrono/TimeUtils>

namespace tc {

namespace key {
constexpr char kSeriesConfigs[]{"series"};
constexpr char kStart[]{"start"};
constexpr char kEnd[]{"end"};
constexpr char kStep[]{"step"};
constexpr char kBoundary[]{"boundary"};
constexpr char kReverse[]{"reverse"};
constexpr char kLogVerbosity[]{"log_verbosity"};
} // namespace key

namespace {

Epoch epochFromJson(const nlohmann::json& json)
{
    const auto str = json.get<std::string>();
    const auto time = epoch::fromString(str);
    if (!time) {
        throw std::invalid_argument("Invalid epoch: " + str);
    }
    return *time;
}

// Either integer nanoseconds or a "<value> <unit>" string
Duration durationFromJson(const nlohmann::json& json)
{
    if (json.is_number_integer()) {
        return Duration{json.get<Duration::rep>()};
    }

    const auto str = json.get<std::string>();
    const auto duration = time::durationFromString(str);
    if (!duration) {
        throw std::invalid_argument("Invalid duration: " + str);
    }
    return *duration;
}

} // namespace

TimeSeries SeriesConfigs::createSeries() const
{
    return {start, end, step, boundary};
}

bool SeriesConfigs::load(const std::string& filename, SeriesConfigs& configs)
{
    std::ifstream file{filename};
    if (!file.is_open()) {
        LOG(WARNING) << "Failed to open series configs file. " << filename;
        return false;
    }

    const auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG(WARNING) << "Invalid JSON document format. " << filename;
        return false;
    }

    if (!j.contains(key::kSeriesConfigs)) {
        LOG(WARNING) << "No series configs found in " << filename;
        return false;
    }

    return SeriesConfigs::loadJson(j.at(key::kSeriesConfigs), configs);
}

bool SeriesConfigs::loadJson(const nlohmann::json& json,
                             SeriesConfigs& configs)
{
    if (!json.is_object() || json.empty()) {
        LOG(WARNING) << "Empty series configs JSON format.";
        return false;
    }

    SeriesConfigs loaded;
    try {
        json.get_to(loaded);
    }
    catch (const nlohmann::json::exception& e) {
        LOG(WARNING) << "Invalid series configs: " << e.what();
        return false;
    }
    catch (const std::invalid_argument& e) {
        LOG(WARNING) << "Invalid series configs: " << e.what();
        return false;
    }

    configs = loaded;
    return true;
}

void to_json(nlohmann::json& json, const SeriesConfigs& configs)
{
    json[key::kStart] = epoch::toString(configs.start);
    json[key::kEnd] = epoch::toString(configs.end);
    json[key::kStep] = configs.step.count();
    json[key::kBoundary] =
        std::string{magic_enum::enum_name(configs.boundary)};
    json[key::kReverse] = configs.reverse;
    json[key::kLogVerbosity] = configs.logVerbosity;
}

void from_json(const nlohmann::json& json, SeriesConfigs& configs)
{
    configs.start = epochFromJson(json.at(key::kStart));
    configs.end = epochFromJson(json.at(key::kEnd));
    configs.step = durationFromJson(json.at(key::kStep));
    if (json.contains(key::kBoundary)) {
        const auto name = json.at(key::kBoundary).get<std::string>();
        const auto boundary = magic_enum::enum_cast<Boundary>(name);
        if (!boundary.has_value()) {
            throw std::invalid_argument("Unknown series boundary: " + name);
        }
        configs.boundary = boundary.value();
    }
    configs.reverse = json.value(key::kReverse, false);
    configs.logVerbosity = json.value(key::kLogVerbosity, 0);
}

} // namespace tc
