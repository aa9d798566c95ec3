#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace snclass {

enum class ModelKind { BuiltinCnn, BuiltinTransformer, UserUploaded };

const char* to_string(ModelKind kind);          // "dash", "transformer", "user"

/*
 * Output index -> label.  Indices are 0-based and contiguous.
 */
class ClassMapping {
public:
    ClassMapping() = default;
    explicit ClassMapping(std::vector<std::string> labels);

    // {"Ia-norm: 2 to 6": 0, …}; ValidationError on gaps or duplicates
    static ClassMapping from_json(const nlohmann::json& j);

    const std::string&              label(std::size_t i) const { return labels_.at(i); }
    const std::vector<std::string>& labels() const { return labels_; }
    std::size_t                     size()   const { return labels_.size(); }

    nlohmann::json to_json() const;

private:
    std::vector<std::string> labels_;
};

// Opaque inference callable: input tensor (rows x N) -> raw output vector
using InferenceBackend = std::function<Vector(const Matrix&)>;

struct ModelDescriptor {
    std::string             id;
    std::string             name;
    ModelKind               kind = ModelKind::UserUploaded;
    std::vector<InputShape> input_shapes;      // accepted spectrum shapes
    InputShape              output_shape;
    ClassMapping            classes;

    std::int64_t output_size() const;          // product of output dims
    bool         accepts(const InputShape& shape) const;
};

/*
 * Throws ValidationError unless the descriptor has an id, at least one
 * input shape, only positive dimensions and an output size equal to the
 * class mapping cardinality.
 */
void validate_descriptor(const ModelDescriptor& d);

/*
 * Upload metadata:
 *   { "model_id": "...", "name": "...", "class_mapping": {label: index},
 *     "input_shape": [1, 1024] | [[1, 1024], [1, 2048]],
 *     "output_shape": [1, K] }
 */
ModelDescriptor descriptor_from_json(const nlohmann::json& j,
                                     ModelKind kind = ModelKind::UserUploaded);

std::vector<InputShape> input_shapes_from_json(const nlohmann::json& j);

struct RegisteredModel {
    ModelDescriptor  descriptor;
    InferenceBackend backend;
};

using ModelPtr = std::shared_ptr<const RegisteredModel>;

} // namespace snclass
