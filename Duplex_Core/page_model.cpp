#include "page_model.h"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

// ============================================================================
// Provenance
// ============================================================================

Provenance Provenance::original(int documentId, int pageNumber) {
    Provenance p;
    p.kind = ProvenanceKind::ORIGINAL;
    p.documentId = documentId;
    p.pageNumber = pageNumber;
    return p;
}

Provenance Provenance::title() {
    Provenance p;
    p.kind = ProvenanceKind::TITLE;
    return p;
}

Provenance Provenance::blank() {
    Provenance p;
    p.kind = ProvenanceKind::BLANK;
    return p;
}

std::string Provenance::label() const {
    switch (kind) {
    case ProvenanceKind::ORIGINAL:
        return std::to_string(pageNumber);
    case ProvenanceKind::TITLE:
        return "T";
    case ProvenanceKind::BLANK:
        return "B";
    }
    return "?";
}

bool Provenance::operator==(const Provenance& other) const {
    if (kind != other.kind) return false;
    if (kind != ProvenanceKind::ORIGINAL) return true;
    return documentId == other.documentId && pageNumber == other.pageNumber;
}

// ============================================================================
// Page
// ============================================================================

int normalize_rotation(int degrees) {
    return ((degrees % 360) + 360) % 360;
}

Page::Page() : source_(nullptr), sourceIndex_(-1), rotation_(0) {
}

Page Page::fromSource(std::shared_ptr<PdfSource> source, int sourceIndex,
                      PageSize size, int rotation) {
    Page page;
    page.source_ = std::move(source);
    page.sourceIndex_ = sourceIndex;
    page.size_ = size;
    page.rotation_ = normalize_rotation(rotation);
    return page;
}

Page Page::synthetic(PageSize size) {
    Page page;
    page.size_ = size;
    return page;
}

void Page::rotate(int degrees) {
    rotation_ = normalize_rotation(rotation_ + degrees);
}

void Page::addOverlay(Overlay overlay) {
    overlays_.push_back(std::move(overlay));
}

// ============================================================================
// Document
// ============================================================================

std::string Document::titleText() const {
    return fs::path(displayName).stem().string();
}

std::string describe_sequence(const PageSequence& pages, bool qualify) {
    std::string text;
    for (const auto& sp : pages) {
        if (!text.empty()) text += ",";
        if (qualify && !sp.provenance.isSynthetic()) {
            text += std::to_string(sp.provenance.documentId) + ":";
        }
        text += sp.provenance.label();
    }
    return text;
}
