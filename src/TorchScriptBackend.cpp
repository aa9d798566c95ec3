#include "snclass/TorchScriptBackend.hpp"
#include "snclass/Errors.hpp"

#include <torch/script.h>
#include <memory>
#include <mutex>

namespace snclass {

namespace {

struct TorchModule {
    torch::jit::script::Module module;
    std::mutex                 mtx;        // guards forward()
};

} // unnamed namespace

InferenceBackend load_torchscript(const std::string& artifact,
                                  const ModelDescriptor& descriptor)
{
    auto impl = std::make_shared<TorchModule>();
    try {
        impl->module = torch::jit::load(artifact);
    } catch (const c10::Error& e) {
        throw ConfigurationError("cannot load TorchScript model '" + artifact + "': "
                                 + e.what_without_backtrace());
    }
    impl->module.eval();

    if (descriptor.input_shapes.empty())
        throw ConfigurationError("model '" + descriptor.id + "' declares no input shape");

    return [impl](const Matrix& input) -> Vector {
        const auto rows = static_cast<std::int64_t>(input.rows());
        const auto cols = static_cast<std::int64_t>(input.cols());

        // Eigen is column-major; copy row by row into a contiguous float tensor
        torch::Tensor t = torch::empty({rows, cols}, torch::kFloat32);
        auto acc = t.accessor<float, 2>();
        for (std::int64_t r = 0; r < rows; ++r)
            for (std::int64_t c = 0; c < cols; ++c)
                acc[r][c] = static_cast<float>(input(r, c));
        if (rows > 1) t = t.unsqueeze(0);

        torch::Tensor out;
        {
            std::lock_guard lk(impl->mtx);
            torch::NoGradGuard no_grad;
            out = impl->module.forward({t}).toTensor();
        }
        out = out.to(torch::kFloat64).contiguous().view({-1});

        Vector v(out.numel());
        const double* p = out.data_ptr<double>();
        for (Eigen::Index i = 0; i < v.size(); ++i) v[i] = p[i];
        return v;
    };
}

} // namespace snclass
