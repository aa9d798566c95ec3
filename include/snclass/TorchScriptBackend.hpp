#pragma once
#include "ModelDescriptor.hpp"
#include <string>

namespace snclass {

/*
 * Load a TorchScript module (.pt) and wrap its forward pass as an
 * InferenceBackend.  The input matrix becomes a float32 tensor of shape
 * {1, rows, N} (or {1, N} for a single row); the output is flattened.
 *
 * Only available when the project is built against libtorch.
 */
InferenceBackend load_torchscript(const std::string& artifact,
                                  const ModelDescriptor& descriptor);

} // namespace snclass
