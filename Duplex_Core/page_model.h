#ifndef PAGE_MODEL_H
#define PAGE_MODEL_H

#include <memory>
#include <string>
#include <vector>

class PdfSource;

// Page size in PDF units (1/72 inch)
struct PageSize {
    double width = 612;   // Letter default
    double height = 792;

    PageSize() {}
    PageSize(double w, double h) : width(w), height(h) {}

    bool operator==(const PageSize& other) const {
        return width == other.width && height == other.height;
    }
};

// Decoded illustration, stored as zlib-compressed planes ready for a PDF image stream
struct RasterImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgb;     // FlateDecode, 8 bits per component
    std::vector<unsigned char> alpha;   // FlateDecode soft mask

    bool is_valid() const { return width > 0 && height > 0 && !rgb.empty(); }
};

// One overlay drawn in the page's own coordinate space (origin at the lower-left
// corner of the media box). The content stream may use /F1 (Helvetica),
// /F2 (Helvetica-Bold), /GS1 (70% fill opacity) and, when image is set, /Im1.
struct Overlay {
    std::string content;
    PageSize size;
    std::shared_ptr<const RasterImage> image;
};

enum class ProvenanceKind {
    ORIGINAL,
    TITLE,
    BLANK
};

// Where an output page came from. pageNumber is the 1-based position in the
// source document before any trimming.
struct Provenance {
    ProvenanceKind kind = ProvenanceKind::BLANK;
    int documentId = 0;
    int pageNumber = 0;

    static Provenance original(int documentId, int pageNumber);
    static Provenance title();
    static Provenance blank();

    bool isSynthetic() const { return kind != ProvenanceKind::ORIGINAL; }

    // "5" for original pages, "T" for title pages, "B" for blank pages
    std::string label() const;

    bool operator==(const Provenance& other) const;
    bool operator!=(const Provenance& other) const { return !(*this == other); }
};

// A page of content plus its mutable rotation. Copying a Page produces an
// independent page: rotation and overlays are owned by value, the source
// content is immutable and only read when the page is written out.
class Page {
public:
    Page();

    static Page fromSource(std::shared_ptr<PdfSource> source, int sourceIndex,
                           PageSize size, int rotation);
    static Page synthetic(PageSize size);

    Page clone() const { return *this; }

    const PageSize& getSize() const { return size_; }
    int getRotation() const { return rotation_; }

    // Adds to the current rotation; result is normalized to 0, 90, 180 or 270
    void rotate(int degrees);

    bool isSourcePage() const { return sourceIndex_ >= 0; }
    const std::shared_ptr<PdfSource>& getSource() const { return source_; }
    int getSourceIndex() const { return sourceIndex_; }

    void addOverlay(Overlay overlay);
    const std::vector<Overlay>& getOverlays() const { return overlays_; }

private:
    std::shared_ptr<PdfSource> source_;
    int sourceIndex_;
    PageSize size_;
    int rotation_;
    std::vector<Overlay> overlays_;
};

struct SequencedPage {
    Page page;
    Provenance provenance;
};

typedef std::vector<SequencedPage> PageSequence;

// One input file after ingestion
struct Document {
    int id = 0;                   // 1-based input index
    std::string displayName;      // filename with extension
    std::string sourcePath;
    int originalPageCount = 0;    // before trimming
    PageSequence pages;

    // Filename without extension
    std::string titleText() const;
};

// Contiguous slice of a sequence, written to one output file
struct Batch {
    int index = 0;                // 1-based
    PageSequence pages;
};

int normalize_rotation(int degrees);

// Comma-separated provenance labels, e.g. "T,3,5,B". With qualify set,
// original pages are prefixed with their document id ("2:5").
std::string describe_sequence(const PageSequence& pages, bool qualify = false);

#endif // PAGE_MODEL_H
