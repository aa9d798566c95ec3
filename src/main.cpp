#include "snclass/Bootstrap.hpp"
#include "snclass/Errors.hpp"
#include "snclass/ReportUtils.hpp"
#include "snclass/SpectrumLoaders.hpp"
#ifdef SNCLASS_WITH_TORCH
#include "snclass/TorchScriptBackend.hpp"
#endif

#include <cxxopts.hpp>
#include <Eigen/Core>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <omp.h>
#include <thread>

namespace fs = std::filesystem;
using namespace snclass;

static BackendLoader make_loader()
{
#ifdef SNCLASS_WITH_TORCH
    return load_torchscript;
#else
    return [](const std::string& artifact, const ModelDescriptor& d) -> InferenceBackend {
        throw ConfigurationError("cannot load model '" + d.id + "' from '" + artifact
                                 + "': snclass was built without libtorch");
    };
#endif
}

static NamedFile read_named(const std::string& path)
{
    return NamedFile{fs::path(path).filename().string(), read_file(path)};
}

static ClassificationOptions options_from_cli(const cxxopts::ParseResult& cli)
{
    ClassificationOptions o;
    o.normalize.smoothing = cli["smoothing"].as<int>();
    if (cli.count("z")) {
        o.normalize.known_z = true;
        o.normalize.z_value = cli["z"].as<double>();
    }
    if (cli.count("min-wave")) o.normalize.min_wave = cli["min-wave"].as<double>();
    if (cli.count("max-wave")) o.normalize.max_wave = cli["max-wave"].as<double>();
    o.parse.lnw_epoch  = cli["epoch"].as<int>();
    o.calculate_rlap   = cli.count("rlap") > 0;
    o.top_n            = static_cast<std::size_t>(std::max(1, cli["top"].as<int>()));

    if (cli.count("user-model"))
        o.model = UserModel{cli["user-model"].as<std::string>()};
    else
        o.model = BuiltinModel{cli["model"].as<std::string>()};

    if (cli.count("sn-type")) {
        RedshiftContext ctx;
        ctx.sn_type = cli["sn-type"].as<std::string>();
        if (cli.count("age-bin")) ctx.age_bin = cli["age-bin"].as<std::string>();
        o.redshift_context = ctx;
    }
    return o;
}

static std::optional<SpectrumFormat> format_from_cli(const cxxopts::ParseResult& cli)
{
    if (!cli.count("format")) return std::nullopt;
    const std::string tag = cli["format"].as<std::string>();
    auto f = format_from_tag(tag);
    if (!f) throw ValidationError("unknown --format '" + tag + "'");
    return f;
}

int main(int argc, char** argv)
{
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("snclass", "Supernova spectrum classification and redshift estimation");
        opts.add_options()
            ("command", "classify | redshift | batch | templates | models",
                cxxopts::value<std::string>())
            ("inputs", "Spectrum files (or one zip archive with --zip)",
                cxxopts::value<std::vector<std::string>>())
            ("settings", "Settings JSON (default: search snclass_settings.json)",
                cxxopts::value<std::string>())
            ("o,output", "Write the JSON result here instead of stdout",
                cxxopts::value<std::string>()->default_value("-"))
            ("format", "Input format tag (fits, dat, txt, ascii, flm, csv, lnw)",
                cxxopts::value<std::string>())
            ("epoch", "Epoch column of multi-epoch LNW input",
                cxxopts::value<int>()->default_value("0"))
            ("model", "Built-in model: dash | transformer",
                cxxopts::value<std::string>()->default_value("dash"))
            ("user-model", "ID of an uploaded model", cxxopts::value<std::string>())
            ("smoothing", "Median filter width 0..20",
                cxxopts::value<int>()->default_value("0"))
            ("z", "Known redshift (enables de-redshifting)", cxxopts::value<double>())
            ("min-wave", "Minimum wavelength [A]", cxxopts::value<double>())
            ("max-wave", "Maximum wavelength [A]", cxxopts::value<double>())
            ("rlap", "Attach the RLAP of the best match (dash only)")
            ("sn-type", "Template type for redshift estimation", cxxopts::value<std::string>())
            ("age-bin", "Template age bin, e.g. \"2 to 6\"", cxxopts::value<std::string>())
            ("top", "Number of best matches to report",
                cxxopts::value<int>()->default_value("3"))
            ("zip", "Treat the single input as a zip archive (batch)")
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("v,verbose", "Progress output")
            ("h,help", "Show help");
        opts.parse_positional({"command", "inputs"});
        opts.positional_help("<command> [files...]");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("command")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
        omp_set_num_threads(std::max(1, nthreads));
        Eigen::setNbThreads(1);

        /* ---------------- startup ---------------------------------------- */
        Settings settings = load_settings(
            cli.count("settings") ? std::optional<std::string>(cli["settings"].as<std::string>())
                                  : std::nullopt);
        if (cli.count("verbose")) settings.verbose = true;

        const Services svc = bootstrap(settings, make_loader());

        const std::string command = cli["command"].as<std::string>();
        const std::string output  = cli["output"].as<std::string>();
        const std::vector<std::string> inputs =
            cli.count("inputs") ? cli["inputs"].as<std::vector<std::string>>()
                                : std::vector<std::string>{};

        /* ---------------- dispatch --------------------------------------- */
        int rc = 0;
        try {
            if (command == "classify") {
                if (inputs.size() != 1)
                    throw ValidationError("classify takes exactly one spectrum file");
                ClassificationRequest req;
                req.file    = read_named(inputs.front());
                req.format  = format_from_cli(cli);
                req.options = options_from_cli(cli);
                write_json(classification_json(svc.pipeline->classify(req)), output);

            } else if (command == "redshift") {
                if (inputs.size() != 1)
                    throw ValidationError("redshift takes exactly one spectrum file");
                if (!cli.count("sn-type") || !cli.count("age-bin"))
                    throw ValidationError("redshift needs --sn-type and --age-bin");
                const ClassificationOptions o = options_from_cli(cli);
                const RedshiftEstimate est = svc.pipeline->estimate_redshift(
                    read_named(inputs.front()), format_from_cli(cli), o.normalize,
                    cli["sn-type"].as<std::string>(), cli["age-bin"].as<std::string>(),
                    o.parse);
                write_json(redshift_json(est), output);

            } else if (command == "batch") {
                BatchRequest req;
                req.options = options_from_cli(cli);
                if (cli.count("zip")) {
                    if (inputs.size() != 1)
                        throw ValidationError("--zip takes exactly one archive");
                    req.archive      = read_file(inputs.front());
                    req.archive_name = fs::path(inputs.front()).filename().string();
                } else {
                    for (const auto& p : inputs) {
                        try {
                            req.files.push_back(read_named(p));
                        } catch (const NotFoundError&) {
                            // unreadable paths become failed items
                            req.files.push_back(NamedFile{fs::path(p).filename().string(), {}});
                        }
                    }
                }
                write_json(batch_json(svc.batch->process(req)), output);

            } else if (command == "templates") {
                nlohmann::json keys = nlohmann::json::array();
                for (const auto& k : svc.templates->keys())
                    keys.push_back(nlohmann::json{{"type", k.sn_type}, {"age_bin", k.age_bin}});
                write_json({{"count", svc.templates->size()}, {"keys", keys}}, output);

            } else if (command == "models") {
                nlohmann::json j = nlohmann::json::object();
                j["builtin"] = nlohmann::json::array();
                for (auto kind : {ModelKind::BuiltinCnn, ModelKind::BuiltinTransformer})
                    if (svc.registry->has_builtin(kind)) j["builtin"].push_back(to_string(kind));
                j["user"] = svc.registry->user_ids();
                write_json(j, output);

            } else {
                throw ValidationError("unknown command '" + command + "'");
            }
        } catch (const Error& e) {
            std::cerr << to_string(e.kind()) << ": " << e.what() << '\n';
            write_json(error_json(e), output);
            rc = 1;
        }

        if (settings.verbose) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            std::cout << "Finished in " << ms << " ms\n";
        }
        return rc;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
