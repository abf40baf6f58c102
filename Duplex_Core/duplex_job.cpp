#include "duplex_job.h"
#include "page_pipeline.h"
#include "pdf_container.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <regex>

namespace fs = std::filesystem;

static const char* ILLUSTRATION_FILENAME = "frontpage.png";

const char* run_state_name(RunState state) {
    switch (state) {
    case RunState::INGEST: return "Ingest";
    case RunState::PREPROCESS: return "Preprocess";
    case RunState::MERGE: return "Merge";
    case RunState::SEQUENCE: return "Sequence";
    case RunState::BATCH: return "Batch";
    case RunState::EMIT: return "Emit";
    case RunState::COMPLETED: return "Completed";
    case RunState::FAILED: return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// Input Discovery
// ============================================================================

bool is_generated_output(const std::string& filename) {
    static const std::regex generated(
        R"(^(Batch_\d+|odd_pages|even_pages_rotated|merged_combined|master_sequence|merged|merged_for_printing|.*_part_\d+_of_\d+)\.pdf$)",
        std::regex::icase);
    return std::regex_match(filename, generated);
}

std::vector<std::string> collect_input_pdfs(const std::string& dir) {
    std::vector<fs::path> found;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (!PdfUtil::is_pdf_filename(name) || is_generated_output(name)) continue;
        found.push_back(entry.path());
    }

    std::sort(found.begin(), found.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });

    std::vector<std::string> files;
    for (const auto& p : found) files.push_back(p.string());
    return files;
}

std::string find_illustration(const std::string& configured, const std::string& inputDir) {
    if (!configured.empty()) return configured;

    std::vector<fs::path> candidates;
    candidates.push_back(fs::current_path() / ILLUSTRATION_FILENAME);
    if (!inputDir.empty()) {
        fs::path dir = fs::absolute(inputDir);
        candidates.push_back(dir / ILLUSTRATION_FILENAME);
        if (dir.has_parent_path()) {
            candidates.push_back(dir.parent_path() / ILLUSTRATION_FILENAME);
        }
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return candidate.string();
    }
    return "";
}

bool same_file_path(const std::string& a, const std::string& b) {
    std::error_code ec_a, ec_b;
    fs::path canonical_a = fs::weakly_canonical(a, ec_a);
    fs::path canonical_b = fs::weakly_canonical(b, ec_b);
    if (ec_a || ec_b) return false;
    return canonical_a == canonical_b;
}

// ============================================================================
// DuplexJob
// ============================================================================

DuplexJob::DuplexJob(const RunConfig& config)
    : config_(config), renderer_(config.titleFontSize, config.numberFontSize) {
}

void DuplexJob::warn(RunReport& report, const std::string& message) {
    std::cerr << "WARNING: " << message << "\n";
    report.warnings.push_back(message);
}

void DuplexJob::fail(RunReport& report, DuplexErrorKind kind, const std::string& message) {
    std::cerr << "ERROR: " << message << "\n";
    report.failedState = report.state;
    report.failureKind = kind;
    report.failureReason = message;
    report.state = RunState::FAILED;
}

std::vector<std::string> DuplexJob::expandInputs(const std::vector<std::string>& inputs,
                                                 RunReport& report) {
    std::vector<std::string> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_directory(input, ec)) {
            auto found = collect_input_pdfs(input);
            std::cout << "INFO: Found " << found.size() << " PDF file(s) in " << input << "\n";
            files.insert(files.end(), found.begin(), found.end());
        } else if (fs::is_regular_file(input, ec)) {
            if (!PdfUtil::is_pdf_filename(input)) {
                warn(report, "Skipping non-PDF file: " + input);
                continue;
            }
            files.push_back(input);
        } else {
            warn(report, "Input not found, skipping: " + input);
        }
    }
    return files;
}

void DuplexJob::prepareRenderer(const std::vector<std::string>& files, RunReport& report) {
    std::string input_dir;
    if (!files.empty()) {
        input_dir = fs::path(files.front()).parent_path().string();
        if (input_dir.empty()) input_dir = ".";
    }

    std::string illustration = find_illustration(config_.illustrationPath, input_dir);
    if (illustration.empty()) {
        std::cout << "INFO: No " << ILLUSTRATION_FILENAME << " found, title pages will be text only\n";
        return;
    }

    if (renderer_.loadIllustration(illustration)) {
        std::cout << "INFO: Title illustration: " << illustration << "\n";
    } else {
        DuplexError error(DuplexErrorKind::RENDER_FAILURE, "title", renderer_.getLastError());
        warn(report, error.describe() + " (using text-only title pages)");
    }
}

DuplexJob::Ingested DuplexJob::ingestOne(const std::string& path, int documentId) const {
    Ingested result;
    result.report.id = documentId;
    result.report.path = path;
    result.report.name = fs::path(path).filename().string();

    std::string error;
    Document document;
    if (!load_document(path, documentId, document, error)) {
        DuplexError io(DuplexErrorKind::IO_FAILURE, "ingest", error, result.report.name);
        result.report.skipped = true;
        result.report.warning = io.describe();
        return result;
    }
    result.report.originalPages = document.originalPageCount;

    try {
        PreparedDocument prepared = PagePipeline::preprocess_document(document, config_, renderer_);
        result.report.trimmedPages = prepared.trimmedPages;
        result.report.titleAdded = prepared.titleAdded;
        result.report.blankAdded = prepared.blankAdded;
        result.report.finalPages = static_cast<int>(prepared.document.pages.size());
        result.document = prepared.document;
        result.ok = true;
    } catch (const DuplexError& e) {
        if (e.getKind() != DuplexErrorKind::INSUFFICIENT_PAGES) throw;
        result.report.skipped = true;
        result.report.warning = e.describe();
    }
    return result;
}

RunReport DuplexJob::run(const std::vector<std::string>& inputs, const std::string& outputDir) {
    RunReport report;

    try {
        config_.validate();

        // Ingest
        report.state = RunState::INGEST;
        std::vector<std::string> files = expandInputs(inputs, report);
        if (files.empty()) {
            throw DuplexError(DuplexErrorKind::EMPTY_INPUT, "ingest", "No input PDF files found");
        }
        prepareRenderer(files, report);

        // Preprocess, config_.jobs documents at a time; results kept in input order
        report.state = RunState::PREPROCESS;
        std::vector<Ingested> ingested;
        ingested.reserve(files.size());
        size_t wave = static_cast<size_t>(config_.jobs);
        for (size_t start = 0; start < files.size(); start += wave) {
            size_t end = std::min(start + wave, files.size());
            if (wave == 1) {
                ingested.push_back(ingestOne(files[start], static_cast<int>(start) + 1));
                continue;
            }
            std::vector<std::future<Ingested>> futures;
            for (size_t i = start; i < end; ++i) {
                futures.push_back(std::async(std::launch::async, &DuplexJob::ingestOne, this,
                                             files[i], static_cast<int>(i) + 1));
            }
            for (auto& f : futures) {
                ingested.push_back(f.get());
            }
        }

        std::vector<Document> documents;
        DocumentNames names;
        for (auto& item : ingested) {
            report.totalInputPages += item.report.originalPages;
            if (item.report.skipped) {
                warn(report, item.report.warning + " (document skipped)");
            } else {
                report.totalTrimmedPages += item.report.trimmedPages;
                names[item.document.id] = item.document.displayName;
                std::cout << "INFO: " << item.report.name << ": " << item.report.originalPages
                          << " -> " << item.report.finalPages << " pages\n";
                documents.push_back(item.document);
            }
            report.documents.push_back(item.report);
        }

        // Merge
        report.state = RunState::MERGE;
        PageSequence merged = PagePipeline::merge_documents(documents);
        report.finalPageCount = static_cast<int>(merged.size());

        // Sequence and batch
        report.state = RunState::SEQUENCE;
        OutputLayout layout = config_.resolveLayout(documents.size());
        std::vector<std::pair<std::string, PageSequence>> outputs;
        if (layout == OutputLayout::SEPARATE) {
            if (config_.duplexScope != DuplexScope::GLOBAL ||
                config_.batchSize != RunConfig().batchSize) {
                warn(report, std::string("Separate layout writes one fronts and one backs file; ") +
                             "duplex scope " + scope_name(config_.duplexScope) + " and batch size " +
                             std::to_string(config_.batchSize) + " are ignored");
            }
            DuplexSplit split = PagePipeline::sequence_duplex(merged, config_, names, renderer_);
            outputs.push_back(std::make_pair("odd_pages.pdf", split.fronts));
            outputs.push_back(std::make_pair("even_pages_rotated.pdf", split.backs));
        } else {
            report.state = RunState::BATCH;
            std::vector<Batch> batches =
                PagePipeline::batch_for_duplex(merged, config_, names, renderer_);
            for (const auto& batch : batches) {
                outputs.push_back(std::make_pair(
                    "Batch_" + std::to_string(batch.index) + ".pdf", batch.pages));
            }
        }

        // Emit
        report.state = RunState::EMIT;
        fs::create_directories(outputDir);
        bool qualify = documents.size() > 1;

        PdfPageWriter writer;
        writer.setOverwrite(config_.overwrite);
        for (const auto& output : outputs) {
            fs::path target = fs::path(outputDir) / output.first;
            for (const auto& file : files) {
                if (same_file_path(target.string(), file)) {
                    throw DuplexError(DuplexErrorKind::IO_FAILURE, "emit",
                                      "Output would overwrite an input file", target.string());
                }
            }

            if (!writer.write(output.second, target.string())) {
                throw DuplexError(DuplexErrorKind::IO_FAILURE, "emit", writer.getLastError(),
                                  target.string());
            }

            ArtifactReport artifact;
            artifact.path = target.string();
            artifact.pageCount = static_cast<int>(output.second.size());
            artifact.sequence = describe_sequence(output.second, qualify);
            report.artifacts.push_back(artifact);
            std::cout << "INFO: Wrote " << artifact.path << " (" << artifact.pageCount << " pages)\n";
        }

        report.state = RunState::COMPLETED;
    } catch (const DuplexError& e) {
        fail(report, e.getKind(), e.describe());
    } catch (const std::exception& e) {
        fail(report, DuplexErrorKind::IO_FAILURE, std::string("[") +
             run_state_name(report.state) + "] " + e.what());
    }

    return report;
}

// ============================================================================
// Reporting
// ============================================================================

void print_run_report(const RunReport& report, std::ostream& out) {
    out << "\n";
    out << "=============================================================================\n";
    out << (report.succeeded() ? "SUCCESS" : "FAILED") << "\n";
    out << "=============================================================================\n";
    out << "Input pages:      " << report.totalInputPages << "\n";
    out << "Trimmed pages:    " << report.totalTrimmedPages << "\n";
    out << "Final pages:      " << report.finalPageCount << "\n";

    if (!report.documents.empty()) {
        out << "\nDocuments:\n";
        for (const auto& doc : report.documents) {
            out << "  " << std::right << std::setw(3) << doc.id << "  "
                << std::left << std::setw(40) << doc.name;
            if (doc.skipped) {
                out << " skipped\n";
                continue;
            }
            out << " " << doc.originalPages << " -> " << doc.finalPages << " pages";
            if (doc.titleAdded) out << ", title";
            if (doc.blankAdded) out << ", blank";
            out << "\n";
        }
    }

    if (!report.artifacts.empty()) {
        out << "\nOutput files:\n";
        for (const auto& artifact : report.artifacts) {
            out << "  " << artifact.path << " (" << artifact.pageCount << " pages)\n";
            out << "    " << artifact.sequence << "\n";
        }
    }

    if (!report.warnings.empty()) {
        out << "\nWarnings:\n";
        for (const auto& w : report.warnings) out << "  " << w << "\n";
    }

    if (!report.succeeded()) {
        out << "\nStopped in " << run_state_name(report.failedState) << ": " << report.failureReason << "\n";
    }
    out << "=============================================================================\n";
    out << "\n";
}

static std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

bool write_report_csv(const RunReport& report, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "ERROR: Cannot write report: " << path << "\n";
        return false;
    }

    out << "record,id,name,original_pages,trimmed_pages,title_added,blank_added,final_pages,status,detail\n";
    for (const auto& doc : report.documents) {
        out << "document," << doc.id << "," << csv_field(doc.name) << ","
            << doc.originalPages << "," << doc.trimmedPages << ","
            << (doc.titleAdded ? 1 : 0) << "," << (doc.blankAdded ? 1 : 0) << ","
            << doc.finalPages << "," << (doc.skipped ? "skipped" : "ok") << ","
            << csv_field(doc.warning) << "\n";
    }
    for (size_t i = 0; i < report.artifacts.size(); ++i) {
        const auto& artifact = report.artifacts[i];
        out << "artifact," << (i + 1) << "," << csv_field(artifact.path) << ",,,,,"
            << artifact.pageCount << ",written," << csv_field(artifact.sequence) << "\n";
    }
    out << "run,," << run_state_name(report.state) << "," << report.totalInputPages << ","
        << report.totalTrimmedPages << ",,," << report.finalPageCount << ","
        << (report.succeeded() ? "ok" : "failed") << "," << csv_field(report.failureReason) << "\n";

    return static_cast<bool>(out);
}
