#pragma once
#include <string>
#include <utility>

namespace snclass {

/*
 * Age (days from maximum light) -> bin label.  Bins are `width` days wide
 * and centred on multiples of `width`; labels read "<lo> to <hi>", e.g.
 * age 3.1 falls into "2 to 6".
 */
struct AgeBinning {
    double width   = 4.0;
    double min_age = -20.0;
    double max_age = 50.0;

    // ValidationError outside [min_age, max_age]
    std::string label(double age) const;
};

/*
 * Split a class label of the form "<type>: <age bin>" into its parts.
 * A label without ": " is all type and an empty age bin.
 */
std::pair<std::string, std::string> split_class_label(const std::string& label);

} // namespace snclass
