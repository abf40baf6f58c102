// A complete preparation run: ingest inputs, preprocess each document,
// merge, sequence for duplex, batch and write the output files.
//
//   Ingest -> Preprocess -> Merge -> Sequence -> Batch -> Emit
//
// Ends in COMPLETED or FAILED; the RunReport records what happened to every
// input document and every artifact written.

#ifndef DUPLEX_JOB_H
#define DUPLEX_JOB_H

#include "duplex_error.h"
#include "overlay_renderer.h"
#include "page_model.h"
#include "run_config.h"

#include <iosfwd>
#include <string>
#include <vector>

enum class RunState {
    INGEST,
    PREPROCESS,
    MERGE,
    SEQUENCE,
    BATCH,
    EMIT,
    COMPLETED,
    FAILED
};

const char* run_state_name(RunState state);

struct DocumentReport {
    int id = 0;
    std::string name;
    std::string path;
    int originalPages = 0;
    int trimmedPages = 0;
    bool titleAdded = false;
    bool blankAdded = false;
    int finalPages = 0;
    bool skipped = false;
    std::string warning;
};

struct ArtifactReport {
    std::string path;
    int pageCount = 0;
    std::string sequence;   // e.g. "1:T,1:3,B"
};

struct RunReport {
    RunState state = RunState::INGEST;
    RunState failedState = RunState::INGEST;   // stage that was running when the run failed
    std::string failureReason;
    DuplexErrorKind failureKind = DuplexErrorKind::INVALID_STATE;

    int totalInputPages = 0;
    int totalTrimmedPages = 0;
    int finalPageCount = 0;

    std::vector<DocumentReport> documents;
    std::vector<ArtifactReport> artifacts;
    std::vector<std::string> warnings;

    bool succeeded() const { return state == RunState::COMPLETED; }
};

class DuplexJob {
public:
    explicit DuplexJob(const RunConfig& config);

    // Process files and/or directories into outputDir. Never throws for
    // pipeline errors: the outcome is in the returned report.
    RunReport run(const std::vector<std::string>& inputs, const std::string& outputDir);

    const RunConfig& getConfig() const { return config_; }

private:
    struct Ingested {
        DocumentReport report;
        Document document;
        bool ok = false;
    };

    std::vector<std::string> expandInputs(const std::vector<std::string>& inputs,
                                          RunReport& report);
    void prepareRenderer(const std::vector<std::string>& files, RunReport& report);
    Ingested ingestOne(const std::string& path, int documentId) const;
    void warn(RunReport& report, const std::string& message);
    void fail(RunReport& report, DuplexErrorKind kind, const std::string& message);

    RunConfig config_;
    OverlayRenderer renderer_;
};

// PDFs in dir sorted by name, excluding files a previous run produced
std::vector<std::string> collect_input_pdfs(const std::string& dir);

// True for Batch_N.pdf, odd_pages.pdf, even_pages_rotated.pdf, merged*.pdf,
// master_sequence.pdf and *_part_N_of_M.pdf
bool is_generated_output(const std::string& filename);

// Locate the title illustration: explicit path, else frontpage.png in the
// working directory, the input directory or its parent. Empty if none.
std::string find_illustration(const std::string& configured, const std::string& inputDir);

// True when both paths resolve to the same file. Paths that cannot be
// resolved never compare equal.
bool same_file_path(const std::string& a, const std::string& b);

void print_run_report(const RunReport& report, std::ostream& out);

bool write_report_csv(const RunReport& report, const std::string& path);

#endif // DUPLEX_JOB_H
