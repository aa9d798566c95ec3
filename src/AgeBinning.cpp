#include "snclass/AgeBinning.hpp"
#include "snclass/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace snclass {

std::string AgeBinning::label(double age) const
{
    if (!std::isfinite(age) || age < min_age || age > max_age) {
        std::ostringstream s;
        s << "age " << age << " outside [" << min_age << ", " << max_age << "]";
        throw ValidationError(s.str());
    }
    const double centre = width * std::floor(age / width + 0.5);
    const double lo = std::max(min_age, centre - 0.5 * width);
    const double hi = std::min(max_age, centre + 0.5 * width);

    std::ostringstream s;
    s << lo << " to " << hi;
    return s.str();
}

std::pair<std::string, std::string> split_class_label(const std::string& label)
{
    const auto pos = label.find(": ");
    if (pos == std::string::npos) return {label, std::string()};
    return {label.substr(0, pos), label.substr(pos + 2)};
}

} // namespace snclass
