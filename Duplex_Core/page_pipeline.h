// Page-sequencing stages for manual duplex printing.
//
// Every stage takes a sequence and returns a new one; inputs are never
// modified. Failures are reported by throwing DuplexError.
//
//   trim_first_last -> inject_title -> pad_to_even     (per document)
//   merge_documents -> split_duplex -> make_batches    (per run)

#ifndef PAGE_PIPELINE_H
#define PAGE_PIPELINE_H

#include "page_model.h"
#include "overlay_renderer.h"
#include "run_config.h"

#include <map>
#include <string>
#include <vector>

// Document id -> name used in watermarks
typedef std::map<int, std::string> DocumentNames;

struct DuplexSplit {
    PageSequence fronts;   // odd positions, reversed
    PageSequence backs;    // even positions, rotated
};

// Counts recorded while a document is preprocessed
struct PreparedDocument {
    Document document;
    int trimmedPages = 0;
    bool titleAdded = false;
    bool blankAdded = false;
};

namespace PagePipeline {

    // Drops the first and last page. Throws INSUFFICIENT_PAGES for n <= 2.
    PageSequence trim_first_last(const PageSequence& pages, const std::string& documentName);

    // Size of the first page, or Letter for an empty sequence
    PageSize content_page_size(const PageSequence& pages);

    // Prepends a generated title page sized to the content pages
    PageSequence inject_title(const PageSequence& pages, const std::string& title,
                              const OverlayRenderer& renderer);

    // Appends a blank page when the length is odd
    PageSequence pad_to_even(const PageSequence& pages);

    // Fronts are positions 1,3,5,... in reverse; backs are 2,4,6,... in order,
    // each rotated by backRotation. Throws INVALID_STATE on odd length.
    DuplexSplit split_duplex(const PageSequence& pages, int backRotation);

    // Watermarks every original page with "{page} | {name}"; synthetic pages
    // are left untouched.
    PageSequence stamp_watermarks(const PageSequence& pages, StampCorner corner,
                                  const DocumentNames& names, const OverlayRenderer& renderer);

    // split_duplex plus watermarks when the configuration enables them
    DuplexSplit sequence_duplex(const PageSequence& pages, const RunConfig& config,
                                const DocumentNames& names, const OverlayRenderer& renderer);

    // Fronts followed by backs
    PageSequence combine_fronts_backs(const DuplexSplit& split);

    // Concatenates in input order. Throws EMPTY_INPUT when nothing is left.
    PageSequence merge_documents(const std::vector<Document>& documents);

    // Contiguous windows of at most batchSize pages. Throws INVALID_CONFIGURATION
    // for batchSize <= 0.
    std::vector<Batch> make_batches(const PageSequence& pages, int batchSize);

    // Sequence and chunk a merged run according to config.duplexScope
    std::vector<Batch> batch_for_duplex(const PageSequence& merged, const RunConfig& config,
                                        const DocumentNames& names,
                                        const OverlayRenderer& renderer);

    // Trim (when enabled), title, pad. Throws INSUFFICIENT_PAGES.
    PreparedDocument preprocess_document(const Document& document, const RunConfig& config,
                                         const OverlayRenderer& renderer);
}

#endif // PAGE_PIPELINE_H
