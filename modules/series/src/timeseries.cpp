#include "timeseries.h"

#include <ostream>

#include <magic_enum/magic_enum.hpp>

#include <tChrono/Epoch>

namespace tc {

std::ostream& operator<<(std::ostream& os, Boundary boundary)
{
    return os << magic_enum::enum_name(boundary);
}

std::ostream& operator<<(std::ostream& os, const TimeSeries& series)
{
    return os << "TimeSeries(" << series.boundary() << ", "
              << epoch::toString(series.startTime()) << " -> "
              << epoch::toString(series.endTime()) << ", step "
              << time::toSeconds(series.step()) << "s, " << series.size()
              << '/' << series.total() << " remaining)";
}

} // namespace tc
