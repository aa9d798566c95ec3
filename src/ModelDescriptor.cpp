#include "snclass/ModelDescriptor.hpp"
#include "snclass/Errors.hpp"
#include "snclass/Spectrum.hpp"
#include <algorithm>

namespace snclass {

const char* to_string(ModelKind kind)
{
    switch (kind) {
        case ModelKind::BuiltinCnn:         return "dash";
        case ModelKind::BuiltinTransformer: return "transformer";
        case ModelKind::UserUploaded:       return "user";
    }
    return "unknown";
}

/* ---------------------------------------------------------------------- */
ClassMapping::ClassMapping(std::vector<std::string> labels)
    : labels_(std::move(labels))
{}

ClassMapping ClassMapping::from_json(const nlohmann::json& j)
{
    if (!j.is_object() || j.empty())
        throw ValidationError("class mapping must be a non-empty {label: index} object");

    std::vector<std::string> labels(j.size());
    std::vector<bool>        seen(j.size(), false);
    for (const auto& el : j.items()) {
        const std::string     label = el.key();
        const nlohmann::json& idx   = el.value();
        if (!idx.is_number_integer())
            throw ValidationError("class mapping index of '" + label + "' is not an integer");
        const auto i = idx.get<std::int64_t>();
        if (i < 0 || i >= static_cast<std::int64_t>(labels.size()))
            throw ValidationError("class mapping index " + std::to_string(i) + " of '"
                                  + label + "' is outside 0.."
                                  + std::to_string(labels.size() - 1));
        if (seen[static_cast<std::size_t>(i)])
            throw ValidationError("class mapping index " + std::to_string(i)
                                  + " is used twice");
        seen[static_cast<std::size_t>(i)]   = true;
        labels[static_cast<std::size_t>(i)] = label;
    }
    return ClassMapping(std::move(labels));
}

nlohmann::json ClassMapping::to_json() const
{
    nlohmann::json j = nlohmann::json::object();
    for (std::size_t i = 0; i < labels_.size(); ++i) j[labels_[i]] = i;
    return j;
}

/* ---------------------------------------------------------------------- */
std::int64_t ModelDescriptor::output_size() const
{
    if (output_shape.empty()) return 0;
    std::int64_t n = 1;
    for (auto d : output_shape) n *= d;
    return n;
}

bool ModelDescriptor::accepts(const InputShape& shape) const
{
    return std::find(input_shapes.begin(), input_shapes.end(), shape) != input_shapes.end();
}

void validate_descriptor(const ModelDescriptor& d)
{
    if (d.id.empty())
        throw ValidationError("model id must not be empty");
    if (d.input_shapes.empty())
        throw ValidationError("model '" + d.id + "' declares no input shape");

    auto positive = [](const InputShape& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](std::int64_t v) { return v > 0; });
    };
    for (const auto& s : d.input_shapes)
        if (!positive(s))
            throw ValidationError("model '" + d.id + "': input shape " + format_shape(s)
                                  + " must have positive dimensions");
    if (!positive(d.output_shape))
        throw ValidationError("model '" + d.id + "': output shape " + format_shape(d.output_shape)
                              + " must have positive dimensions");

    if (d.output_size() != static_cast<std::int64_t>(d.classes.size()))
        throw ValidationError("Model output shape " + format_shape(d.output_shape)
                              + " does not match class mapping size "
                              + std::to_string(d.classes.size()));
}

/* ---------------------------------------------------------------------- */
static InputShape shape_from_json(const nlohmann::json& j)
{
    if (!j.is_array())
        throw ValidationError("shape must be an array of integers, got " + j.dump());
    InputShape s;
    for (const auto& v : j) {
        if (!v.is_number_integer())
            throw ValidationError("shape must be an array of integers, got " + j.dump());
        s.push_back(v.get<std::int64_t>());
    }
    return s;
}

std::vector<InputShape> input_shapes_from_json(const nlohmann::json& j)
{
    std::vector<InputShape> out;
    if (j.is_array() && !j.empty() && j.front().is_array()) {
        for (const auto& s : j) out.push_back(shape_from_json(s));
    } else {
        out.push_back(shape_from_json(j));
    }
    return out;
}

ModelDescriptor descriptor_from_json(const nlohmann::json& j, ModelKind kind)
{
    for (const char* key : {"model_id", "class_mapping", "input_shape", "output_shape"})
        if (!j.contains(key))
            throw ValidationError(std::string("model metadata is missing '") + key + "'");

    ModelDescriptor d;
    try {
        d.id   = j.at("model_id").get<std::string>();
        d.name = j.value("name", d.id);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("model metadata: ") + e.what());
    }
    d.kind         = kind;
    d.classes      = ClassMapping::from_json(j.at("class_mapping"));
    d.input_shapes = input_shapes_from_json(j.at("input_shape"));
    d.output_shape = shape_from_json(j.at("output_shape"));
    validate_descriptor(d);
    return d;
}

} // namespace snclass
