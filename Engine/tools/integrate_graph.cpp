/**
 * @file integrate_graph.cpp
 * @brief Merge per-document extraction files into one knowledge graph
 *
 * Usage: broadsheet_integrate <input_dir> [--json <file>] [--csv-dir <dir>]
 *                             [--threshold <x>] [--threads <n>] [--debug]
 *
 * Exit status: 0 on success, 2 if some input files were skipped, 1 on fatal error.
 */

#include <integration/global_integrator.hpp>
#include <integration/integration_config.hpp>
#include <ingestion/document_loader.hpp>
#include <export/graph_exporter.hpp>
#include <storage/graph_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace Broadsheet;
namespace fs = std::filesystem;

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <input_dir> [options]\n"
              << "  --json <file>       integrated graph output\n"
              << "                      (default: <input_dir>/../integrated_results/integrated_knowledge_graph.json)\n"
              << "  --csv-dir <dir>     CSV tables output (default: <input_dir>/../graph_import)\n"
              << "  --threshold <x>     text similarity threshold in [0, 1] (default 0.8)\n"
              << "  --threads <n>       file loader threads, 0 = hardware concurrency\n"
              << "  --debug             trace every match, merge and relation decision\n";
}

static double parse_number(const std::string& flag, const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (text.empty() || end != begin + text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    return v;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    try {
        IntegrationConfig config = IntegrationConfig::from_env();

        std::optional<fs::path> input_dir;
        std::optional<fs::path> json_path;
        std::optional<fs::path> csv_dir;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
                return argv[++i];
            };

            if (arg == "--json") {
                json_path = fs::path(value());
            } else if (arg == "--csv-dir") {
                csv_dir = fs::path(value());
            } else if (arg == "--threshold") {
                double t = parse_number(arg, value());
                if (t < 0.0 || t > 1.0) throw std::invalid_argument("--threshold must be within [0, 1]");
                config.similarity_threshold = t;
            } else if (arg == "--threads") {
                double n = parse_number(arg, value());
                if (n < 0.0 || n > 1024.0) throw std::invalid_argument("--threads must be within [0, 1024]");
                if (n != std::floor(n)) throw std::invalid_argument("--threads expects a whole number");
                config.loader_threads = static_cast<size_t>(n);
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("unknown option " + arg);
            } else if (!input_dir) {
                input_dir = fs::path(arg);
            } else {
                throw std::invalid_argument("unexpected argument " + arg);
            }
        }

        if (!input_dir) throw std::invalid_argument("missing <input_dir>");
        config.apply_log_threshold();

        fs::path input_abs = fs::absolute(*input_dir).lexically_normal();
        if (!input_abs.has_filename()) input_abs = input_abs.parent_path();  // trailing separator
        const fs::path parent = input_abs.parent_path();
        if (!json_path) json_path = parent / "integrated_results" / "integrated_knowledge_graph.json";
        if (!csv_dir) csv_dir = parent / "graph_import";

        Timer timer;
        auto files = DocumentLoader::list_inputs(*input_dir);
        if (files.empty()) {
            Logger::warn("No JSON files found in " + input_dir->string());
        }
        Logger::step("Loading " + std::to_string(files.size()) + " files on " +
                     std::to_string(config.effective_loader_threads()) + " threads");
        auto loaded = DocumentLoader::load_batch(files, config.effective_loader_threads());

        GraphStore store;
        GlobalIntegrator integrator(store, config);
        BatchSummary summary = integrator.integrate_batch(loaded);
        const GraphStore& graph = integrator.finalize();

        GraphExporter::write_json(graph, *json_path);

        ValidationReport report = integrator.validate();
        report.print();
        if (report.location_without_coords > 0) {
            Logger::warn(std::to_string(report.location_without_coords) + " location entities lack coordinates");
        }
        if (report.time_without_dates > 0) {
            Logger::warn(std::to_string(report.time_without_dates) + " time entities lack date information");
        }

        GraphExporter::write_tables(graph, *csv_dir);

        std::cout << "\nIntegration complete in " << Timer::format(timer.elapsed_ms()) << "\n";
        std::cout << "  Files processed:   " << (summary.files_total - summary.files_failed) << "/"
                  << summary.files_total << "\n";
        std::cout << "  Documents:         " << summary.documents << "\n";
        std::cout << "  Unique entities:   " << graph.entity_count() << " ("
                  << summary.stats.entities_created << " created, " << summary.stats.entities_merged
                  << " merged)\n";
        std::cout << "  Unique relations:  " << graph.relation_count() << " ("
                  << summary.stats.relations_merged << " duplicates, " << summary.stats.relations_dropped
                  << " dropped)\n";
        std::cout << "  Records skipped:   " << summary.records_skipped.total() << "\n";

        if (summary.partial()) {
            Logger::warn(std::to_string(summary.files_failed) + " of " + std::to_string(summary.files_total) +
                         " files could not be processed");
            return 2;
        }
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
