// duplex_processor.cpp - Prepare PDFs for manual duplex printing
//
// Standalone C++17 CLI tool. Removes the first and last page of each input,
// adds a title page, pads to an even page count and splits the result into a
// fronts file and a backs file (or print-ready batches for several inputs).
//
// Usage: duplex_processor <input.pdf|directory> [...] [options]
//
// Output layouts:
//   separate  - odd_pages.pdf (fronts, reversed) + even_pages_rotated.pdf (backs)
//               Default for a single input document.
//   batched   - Batch_1.pdf ... Batch_N.pdf, fronts followed by backs.
//               Default for several input documents.
//
// Options (accepted with one or two leading dashes, case-insensitive):
//   --OutputDir <dir>          - Output directory (default: current directory)
//   --RemoveFirstLast <bool>   - Drop first and last page of each input (default: true)
//   --NoTrim                   - Same as --RemoveFirstLast false
//   --AddWatermarks <bool>     - Stamp "{page} | {file}" on content pages (default: true)
//   --NoWatermarks             - Same as --AddWatermarks false
//   --RotationAngle <deg>      - Back-page rotation: 90, 180 or 270 (default: 180)
//   --BatchSize <n>            - Pages per batch file (default: 20)
//   --FontSize <n>             - Watermark font size (default: 12)
//   --TitleFontSize <n>        - Title font size (default: 36)
//   --DuplexScope <scope>      - global or per_batch (default: global)
//   --Layout <layout>          - auto, separate or batched (default: auto)
//   --Illustration <image>     - Title-page image (default: frontpage.png if present)
//   --Jobs <n>                 - Documents preprocessed concurrently (default: 1)
//   --Overwrite                - Replace existing output files
//   --Report <file.csv>        - Write the run report as CSV
//   --Print                    - Send the fronts to the printer (separate layout)
//   --Printer <name>           - CUPS printer for --Print (default: system default)
//
// Dependencies:
//   - QPDF library (page assembly and PDF writing)
//   - zlib (image stream compression)
//   - stb_image (title illustration decoding)
//
// Exit codes:
//   0  - Success
//   1  - Invalid arguments
//   2  - File not found
//   3  - Insufficient pages
//   4  - Invalid configuration
//   5  - Empty input
//   6  - Write error
//   7  - Invalid state
//   8  - Print error
//   10 - Unknown error

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "duplex_error.h"
#include "duplex_job.h"
#include "printer_driver.h"
#include "run_config.h"

namespace fs = std::filesystem;

struct CliOptions {
    std::vector<std::string> inputs;
    std::string outputDir = ".";
    std::string reportPath;
    bool print = false;
    std::string printerName;
};

static void print_usage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " <input.pdf|directory> [...] [options]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --OutputDir <dir>          - Output directory (default: .)\n";
    std::cerr << "  --RemoveFirstLast <bool>   - Drop first and last page (default: true)\n";
    std::cerr << "  --NoTrim                   - Keep first and last page\n";
    std::cerr << "  --AddWatermarks <bool>     - Page-number watermarks (default: true)\n";
    std::cerr << "  --NoWatermarks             - Disable watermarks\n";
    std::cerr << "  --RotationAngle <deg>      - Back-page rotation 90, 180, 270 (default: 180)\n";
    std::cerr << "  --BatchSize <n>            - Pages per batch (default: 20)\n";
    std::cerr << "  --FontSize <n>             - Watermark font size (default: 12)\n";
    std::cerr << "  --TitleFontSize <n>        - Title font size (default: 36)\n";
    std::cerr << "  --DuplexScope <scope>      - global or per_batch (default: global)\n";
    std::cerr << "  --Layout <layout>          - auto, separate, batched (default: auto)\n";
    std::cerr << "  --Illustration <image>     - Title-page image (default: frontpage.png)\n";
    std::cerr << "  --Jobs <n>                 - Concurrent document preprocessing (default: 1)\n";
    std::cerr << "  --Overwrite                - Replace existing output files\n";
    std::cerr << "  --Report <file.csv>        - Write run report as CSV\n";
    std::cerr << "  --Print                    - Print the fronts file (separate layout)\n";
    std::cerr << "  --Printer <name>           - Printer for --Print\n";
    std::cerr << "\nExit Codes:\n";
    std::cerr << "  0  - Success\n";
    std::cerr << "  1  - Invalid arguments\n";
    std::cerr << "  2  - File not found\n";
    std::cerr << "  3  - Insufficient pages\n";
    std::cerr << "  4  - Invalid configuration\n";
    std::cerr << "  5  - Empty input\n";
    std::cerr << "  6  - Write error\n";
    std::cerr << "  7  - Invalid state\n";
    std::cerr << "  8  - Print error\n";
    std::cerr << "  10 - Unknown error\n";
}

// Splits the non-configuration arguments into inputs and CLI options.
// Returns false on an unknown option or a missing value.
static bool parse_cli_args(const std::vector<std::string>& args, CliOptions& cli) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.empty() || arg[0] != '-') {
            cli.inputs.push_back(arg);
            continue;
        }

        std::string name = normalize_option(arg);
        bool has_value = i + 1 < args.size();
        if (name == "outputdir" && has_value) {
            cli.outputDir = args[++i];
        } else if (name == "report" && has_value) {
            cli.reportPath = args[++i];
        } else if (name == "printer" && has_value) {
            cli.printerName = args[++i];
            cli.print = true;
        } else if (name == "print") {
            cli.print = true;
        } else {
            std::cerr << "ERROR: Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

static int print_fronts(const RunReport& report, const std::string& printerName) {
    if (report.artifacts.size() != 2 ||
        fs::path(report.artifacts[0].path).filename() != "odd_pages.pdf") {
        std::cerr << "WARNING: --Print applies to the separate layout only; "
                  << "print each Batch_N.pdf in turn\n";
        return EC_SUCCESS;
    }

    const ArtifactReport& fronts = report.artifacts[0];
    const ArtifactReport& backs = report.artifacts[1];

    CupsPrinterDriver printer(printerName);
    RefeedOutcome outcome = print_fronts_for_refeed(printer, fronts.path);
    if (!outcome.print.submitted) {
        return EC_PRINT_ERROR;
    }
    if (!outcome.reversed && !printer.getLastError().empty()) {
        std::cerr << "WARNING: " << printer.getLastError() << "\n";
    }
    std::cout << "INFO: When the stack is re-loaded, print: " << backs.path << "\n";
    return EC_SUCCESS;
}

int main(int argc, char* argv[]) {
    if (argc == 2 && (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return EC_SUCCESS;
    }
    if (argc < 2) {
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }

    RunConfig config;
    CliOptions cli;
    try {
        std::vector<std::string> rest;
        parse_config_args(argc, argv, 1, config, rest);
        if (!parse_cli_args(rest, cli)) {
            print_usage(argv[0]);
            return EC_INVALID_ARGS;
        }
        config.validate();
    } catch (const DuplexError& e) {
        std::cerr << "ERROR: " << e.describe() << "\n";
        return exit_code_for(e.getKind());
    }

    if (cli.inputs.empty()) {
        std::cerr << "ERROR: No input files given\n";
        print_usage(argv[0]);
        return EC_INVALID_ARGS;
    }

    bool any_exists = false;
    for (const auto& input : cli.inputs) {
        std::error_code ec;
        if (fs::exists(input, ec)) any_exists = true;
    }
    if (!any_exists) {
        std::cerr << "ERROR: Input not found: " << cli.inputs.front() << "\n";
        return EC_FILE_NOT_FOUND;
    }

    std::cout << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "Duplex Processor\n";
    std::cout << "=============================================================================\n";
    std::cout << "Inputs:         " << cli.inputs.size() << "\n";
    std::cout << "Output dir:     " << cli.outputDir << "\n";
    std::cout << "Trim:           " << (config.removeFirstLast ? "first and last page" : "off") << "\n";
    std::cout << "Watermarks:     " << (config.addWatermarks ? "on" : "off") << "\n";
    std::cout << "Back rotation:  " << config.rotationAngle << "\n";
    std::cout << "Batch size:     " << config.batchSize << " (" << scope_name(config.duplexScope) << ")\n";
    std::cout << "Layout:         " << layout_name(config.layout) << "\n";
    std::cout << "=============================================================================\n";
    std::cout << "\n";

    DuplexJob job(config);
    RunReport report = job.run(cli.inputs, cli.outputDir);
    print_run_report(report, std::cout);

    if (!cli.reportPath.empty()) {
        if (write_report_csv(report, cli.reportPath)) {
            std::cout << "INFO: Report written to " << cli.reportPath << "\n";
        } else if (report.succeeded()) {
            return EC_WRITE_ERROR;
        }
    }

    if (!report.succeeded()) {
        return exit_code_for(report.failureKind);
    }

    if (cli.print) {
        return print_fronts(report, cli.printerName);
    }
    return EC_SUCCESS;
}
