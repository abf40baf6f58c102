#include "page_pipeline.h"
#include "duplex_error.h"

#include <algorithm>

namespace PagePipeline {

// ============================================================================
// Per-Document Stages
// ============================================================================

PageSequence trim_first_last(const PageSequence& pages, const std::string& documentName) {
    if (pages.size() <= 2) {
        throw DuplexError(DuplexErrorKind::INSUFFICIENT_PAGES, "trim",
                          "Document has only " + std::to_string(pages.size()) +
                          " page(s), cannot remove first and last",
                          documentName);
    }
    return PageSequence(pages.begin() + 1, pages.end() - 1);
}

PageSize content_page_size(const PageSequence& pages) {
    if (pages.empty()) return PageSize();
    return pages.front().page.getSize();
}

PageSequence inject_title(const PageSequence& pages, const std::string& title,
                          const OverlayRenderer& renderer) {
    PageSize size = content_page_size(pages);

    SequencedPage title_page;
    title_page.page = Page::synthetic(size);
    title_page.page.addOverlay(renderer.renderTitle(title, size));
    title_page.provenance = Provenance::title();

    PageSequence result;
    result.reserve(pages.size() + 1);
    result.push_back(title_page);
    result.insert(result.end(), pages.begin(), pages.end());
    return result;
}

PageSequence pad_to_even(const PageSequence& pages) {
    PageSequence result = pages;
    if (result.size() % 2 != 0) {
        SequencedPage blank;
        blank.page = Page::synthetic(content_page_size(pages));
        blank.provenance = Provenance::blank();
        result.push_back(blank);
    }
    return result;
}

PreparedDocument preprocess_document(const Document& document, const RunConfig& config,
                                     const OverlayRenderer& renderer) {
    PreparedDocument prepared;
    prepared.document = document;

    if (document.pages.empty()) {
        throw DuplexError(DuplexErrorKind::INSUFFICIENT_PAGES, "ingest",
                          "Document has no pages", document.displayName);
    }

    PageSequence pages = document.pages;
    if (config.removeFirstLast) {
        pages = trim_first_last(pages, document.displayName);
        prepared.trimmedPages = static_cast<int>(document.pages.size() - pages.size());
    }

    pages = inject_title(pages, document.titleText(), renderer);
    prepared.titleAdded = true;

    size_t before_pad = pages.size();
    pages = pad_to_even(pages);
    prepared.blankAdded = pages.size() != before_pad;

    prepared.document.pages = pages;
    return prepared;
}

// ============================================================================
// Duplex Sequencing
// ============================================================================

DuplexSplit split_duplex(const PageSequence& pages, int backRotation) {
    if (pages.size() % 2 != 0) {
        throw DuplexError(DuplexErrorKind::INVALID_STATE, "sequence",
                          "Cannot split an odd-length sequence (" +
                          std::to_string(pages.size()) + " pages)");
    }

    DuplexSplit split;
    size_t k = pages.size() / 2;
    split.fronts.reserve(k);
    split.backs.reserve(k);

    // Index 0, 2, 4, ... are the 1-based odd positions
    for (size_t i = 0; i < pages.size(); i += 2) {
        split.fronts.push_back(pages[i]);
    }
    std::reverse(split.fronts.begin(), split.fronts.end());

    for (size_t i = 1; i < pages.size(); i += 2) {
        SequencedPage back = pages[i];
        back.page.rotate(backRotation);
        split.backs.push_back(back);
    }
    return split;
}

PageSequence stamp_watermarks(const PageSequence& pages, StampCorner corner,
                              const DocumentNames& names, const OverlayRenderer& renderer) {
    PageSequence result = pages;
    for (auto& sp : result) {
        if (sp.provenance.isSynthetic()) continue;

        auto it = names.find(sp.provenance.documentId);
        std::string name = it != names.end() ? it->second : "";
        std::string text = watermark_text(sp.provenance.pageNumber, name);
        sp.page.addOverlay(renderer.renderWatermark(text, sp.page.getSize(), corner));
    }
    return result;
}

DuplexSplit sequence_duplex(const PageSequence& pages, const RunConfig& config,
                            const DocumentNames& names, const OverlayRenderer& renderer) {
    DuplexSplit split = split_duplex(pages, config.rotationAngle);
    if (config.addWatermarks) {
        split.fronts = stamp_watermarks(split.fronts, StampCorner::BOTTOM_RIGHT, names, renderer);
        split.backs = stamp_watermarks(split.backs, StampCorner::TOP_LEFT, names, renderer);
    }
    return split;
}

PageSequence combine_fronts_backs(const DuplexSplit& split) {
    PageSequence combined;
    combined.reserve(split.fronts.size() + split.backs.size());
    combined.insert(combined.end(), split.fronts.begin(), split.fronts.end());
    combined.insert(combined.end(), split.backs.begin(), split.backs.end());
    return combined;
}

// ============================================================================
// Merging and Batching
// ============================================================================

PageSequence merge_documents(const std::vector<Document>& documents) {
    if (documents.empty()) {
        throw DuplexError(DuplexErrorKind::EMPTY_INPUT, "merge", "No documents to merge");
    }

    PageSequence merged;
    for (const auto& doc : documents) {
        merged.insert(merged.end(), doc.pages.begin(), doc.pages.end());
    }

    if (merged.empty()) {
        throw DuplexError(DuplexErrorKind::EMPTY_INPUT, "merge",
                          "None of the " + std::to_string(documents.size()) +
                          " document(s) contain pages");
    }
    return merged;
}

std::vector<Batch> make_batches(const PageSequence& pages, int batchSize) {
    if (batchSize <= 0) {
        throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "batch",
                          "Batch size must be > 0 (got " + std::to_string(batchSize) + ")");
    }

    std::vector<Batch> batches;
    size_t size = static_cast<size_t>(batchSize);
    for (size_t start = 0; start < pages.size(); start += size) {
        size_t end = std::min(start + size, pages.size());
        Batch batch;
        batch.index = static_cast<int>(batches.size()) + 1;
        batch.pages.assign(pages.begin() + start, pages.begin() + end);
        batches.push_back(batch);
    }
    return batches;
}

std::vector<Batch> batch_for_duplex(const PageSequence& merged, const RunConfig& config,
                                    const DocumentNames& names,
                                    const OverlayRenderer& renderer) {
    if (config.duplexScope == DuplexScope::GLOBAL) {
        DuplexSplit split = sequence_duplex(merged, config, names, renderer);
        return make_batches(combine_fronts_backs(split), config.batchSize);
    }

    // PER_BATCH: each window is printed as its own duplex job
    if (config.batchSize % 2 != 0) {
        throw DuplexError(DuplexErrorKind::INVALID_CONFIGURATION, "batch",
                          "Batch size must be even when duplex scope is per_batch (got " +
                          std::to_string(config.batchSize) + ")");
    }

    std::vector<Batch> batches = make_batches(merged, config.batchSize);
    for (auto& batch : batches) {
        DuplexSplit split = sequence_duplex(batch.pages, config, names, renderer);
        batch.pages = combine_fronts_backs(split);
    }
    return batches;
}

} // namespace PagePipeline
