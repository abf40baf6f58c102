// print_ready_batcher.cpp - Merge a folder of PDFs into print-ready duplex batches
//
// Standalone C++17 CLI tool. Every PDF in the input directory (sorted by name,
// previous outputs excluded) is trimmed, given a title page and padded to an
// even count. The merged sequence is cut into batches; each batch file holds
// its reversed fronts followed by its rotated backs, so one batch at a time
// can be printed, turned over and re-fed.
//
// Usage: print_ready_batcher [--InputDir <dir>] [--OutputDir <dir>] [options]
//
// Options:
//   --InputDir <dir>           - Directory with input PDFs (default: .)
//   --OutputDir <dir>          - Directory for Batch_N.pdf (default: .)
//   --BatchSize <n>            - Pages per batch, even (default: 20)
//   --DuplexScope <scope>      - per_batch or global (default: per_batch)
//   --Report <file.csv>        - Write the run report as CSV
//   plus every duplex_processor configuration option
//
// Exit codes: as duplex_processor

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "duplex_error.h"
#include "duplex_job.h"
#include "run_config.h"

namespace fs = std::filesystem;

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " [--InputDir <dir>] [--OutputDir <dir>] [options]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --InputDir <dir>           - Directory with input PDFs (default: .)\n";
    std::cerr << "  --OutputDir <dir>          - Output directory (default: .)\n";
    std::cerr << "  --BatchSize <n>            - Pages per batch, even (default: 20)\n";
    std::cerr << "  --DuplexScope <scope>      - per_batch or global (default: per_batch)\n";
    std::cerr << "  --NoTrim                   - Keep first and last page\n";
    std::cerr << "  --NoWatermarks             - Disable watermarks\n";
    std::cerr << "  --RotationAngle <deg>      - Back-page rotation (default: 180)\n";
    std::cerr << "  --Overwrite                - Replace existing Batch_N.pdf files\n";
    std::cerr << "  --Report <file.csv>        - Write run report as CSV\n";
    std::cerr << "\nBatches are written as Batch_1.pdf ... Batch_N.pdf.\n";
}

int main(int argc, char* argv[]) {
    if (argc == 2 && (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return EC_SUCCESS;
    }

    RunConfig config;
    config.duplexScope = DuplexScope::PER_BATCH;
    config.layout = OutputLayout::BATCHED;

    std::string input_dir = ".";
    std::string output_dir = ".";
    std::string report_path;

    try {
        std::vector<std::string> rest;
        parse_config_args(argc, argv, 1, config, rest);

        for (size_t i = 0; i < rest.size(); ++i) {
            std::string name = normalize_option(rest[i]);
            bool has_value = i + 1 < rest.size();
            if (name == "inputdir" && has_value) {
                input_dir = rest[++i];
            } else if (name == "outputdir" && has_value) {
                output_dir = rest[++i];
            } else if (name == "report" && has_value) {
                report_path = rest[++i];
            } else {
                std::cerr << "ERROR: Unknown or incomplete option: " << rest[i] << "\n";
                print_usage(argv[0]);
                return EC_INVALID_ARGS;
            }
        }
        config.validate();
    } catch (const DuplexError& e) {
        std::cerr << "ERROR: " << e.describe() << "\n";
        return exit_code_for(e.getKind());
    }

    if (!fs::is_directory(input_dir)) {
        std::cerr << "ERROR: Input directory not found: " << input_dir << "\n";
        return EC_FILE_NOT_FOUND;
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Print-Ready Batcher\n";
    std::cout << "=============================================================================\n";
    std::cout << "Input dir:      " << input_dir << "\n";
    std::cout << "Output dir:     " << output_dir << "\n";
    std::cout << "Batch size:     " << config.batchSize << "\n";
    std::cout << "Duplex scope:   " << scope_name(config.duplexScope) << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";

    DuplexJob job(config);
    RunReport report = job.run({input_dir}, output_dir);
    print_run_report(report, std::cout);

    if (!report_path.empty() && !write_report_csv(report, report_path) && report.succeeded()) {
        return EC_WRITE_ERROR;
    }

    return report.succeeded() ? EC_SUCCESS : exit_code_for(report.failureKind);
}
