#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include "jtl/Chain.hpp"
#include "jtl/Errors.hpp"
#include "jtl/Jq.hpp"
#include "jtl/Loader.hpp"
#include "jtl/Mapping.hpp"
#include "jtl/SpecLoader.hpp"
#include "jtl/Util.hpp"

using namespace jtl;

namespace {

// Runs one ETL spec over --src, seeded from --dst when that file exists
Value run_single(const cxxopts::ParseResult& result, const Evaluator& evaluator,
                 const EngineOptions& engine) {
    const EtlSpec spec = load_etl_spec(load_document_file(result["etl"].as<std::string>()));
    const Value source = load_document_file(result["src"].as<std::string>());

    Value destination = Value::object();
    if (result.count("dst")) {
        const auto dst = result["dst"].as<std::string>();
        if (file_exists(dst)) destination = load_document_file(dst);
    }

    MappingExecutor executor(evaluator, engine);
    executor.run(spec, source, destination);
    return destination;
}

Value run_meta(const std::string& meta_path, bool verbose, const Evaluator& evaluator,
               const EngineOptions& engine) {
    const ChainSpec chain = parse_chain_spec(load_document_file(meta_path));
    FileDocumentSource documents(std::filesystem::path(meta_path).parent_path().string());

    ChainRunner runner(evaluator, documents, engine);
    if (verbose) runner.set_trace(std::cerr);
    return runner.run(chain);
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jtl", "JSON-to-JSON ETL: declaratively extract and transform one JSON structure into another");

        options.add_options()
            ("etl", "ETL spec file (single ETL)", cxxopts::value<std::string>())
            ("meta", "Meta-ETL spec file (chain multiple ETLs)", cxxopts::value<std::string>())
            ("src", "Source JSON file (required for --etl)", cxxopts::value<std::string>())
            ("dst", "Destination/seed JSON file (created as {} if missing)", cxxopts::value<std::string>())
            ("out", "Output file, '-' for stdout", cxxopts::value<std::string>()->default_value("-"))
            ("stdout", "Force writing output to stdout (overrides --out)")
            ("delimiter", "Default delimiter for string upserts", cxxopts::value<std::string>()->default_value("\\n"))
            ("format", "Output format: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("timeout-ms", "Deadline for each expression evaluation, in milliseconds", cxxopts::value<long>())
            ("v,verbose", "Trace chain steps to stderr")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        const bool has_etl = result.count("etl") > 0;
        const bool has_meta = result.count("meta") > 0;
        if (has_etl == has_meta) {
            std::cerr << "Error: exactly one of --etl or --meta is required\n";
            return 1;
        }
        if (has_etl && !result.count("src")) {
            std::cerr << "Error: for single ETL mode, the following are required: --etl, --src\n";
            return 1;
        }

        EngineOptions engine;
        engine.delimiter = decode_escapes(result["delimiter"].as<std::string>());
        if (result.count("timeout-ms")) {
            engine.evaluation_timeout = std::chrono::milliseconds(result["timeout-ms"].as<long>());
        }
        engine.validate();

        const OutputFormat format = parse_output_format(result["format"].as<std::string>());
        const JqEvaluator evaluator(engine.evaluation_timeout);

        const Value output = has_meta
            ? run_meta(result["meta"].as<std::string>(), result.count("verbose") > 0, evaluator, engine)
            : run_single(result, evaluator, engine);

        const std::string out = result["out"].as<std::string>();
        if (result.count("stdout") || out.empty() || out == "-") {
            std::cout << dump_document(output, format) << "\n";
        } else {
            write_document_file(out, output, format);
            if (result.count("verbose")) {
                std::cerr << "Wrote " << (format == OutputFormat::Toml ? "TOML" : "JSON")
                          << " to " << out << "\n";
            }
        }
        return 0;

    } catch (const TransformError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
