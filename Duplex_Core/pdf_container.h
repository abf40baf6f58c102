// PDF container access through the QPDF library.
//
// PdfSource opens an input document and exposes its pages; PdfPageWriter
// assembles a PageSequence (source pages, rotation, overlays and synthetic
// pages) into a new document and writes it atomically.

#ifndef PDF_CONTAINER_H
#define PDF_CONTAINER_H

#include "page_model.h"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

class PdfSource {
public:
    PdfSource();

    // Read the file into memory, parse it and load its page list. The file is
    // closed again before this returns. Returns false on any read or QPDF error.
    bool load(const std::string& filename);

    int getPageCount() const { return static_cast<int>(pages_.size()); }
    PageSize getPageSize(int index) const;
    int getPageRotation(int index) const;
    QPDFPageObjectHelper getPageHelper(int index) const { return pages_.at(index); }

    const std::string& getFilename() const { return filename_; }
    const std::string& getLastError() const { return lastError_; }

private:
    std::string data_;   // file contents; QPDF reads objects from here lazily
    std::unique_ptr<QPDF> pdf_;
    std::vector<QPDFPageObjectHelper> pages_;
    std::string filename_;
    std::string lastError_;
};

// Opens a document and builds one Page per source page, with ORIGINAL
// provenance numbered from 1. Returns false and sets error on failure.
bool load_document(const std::string& path, int documentId, Document& document,
                   std::string& error);

class PdfPageWriter {
public:
    PdfPageWriter();

    // Allow replacing an existing output file (logged as a warning)
    void setOverwrite(bool overwrite) { overwrite_ = overwrite; }

    // Write pages in order. The file only appears under outputFile once it is
    // complete; on failure no partial file is left behind.
    bool write(const PageSequence& pages, const std::string& outputFile);

    const std::string& getLastError() const { return lastError_; }

private:
    void addPage(QPDF& out, const SequencedPage& sp);
    QPDFObjectHandle makeSyntheticPage(QPDF& out, const Page& page);
    void applyOverlays(QPDF& out, QPDFObjectHandle page_oh, const Page& page);
    QPDFObjectHandle makeOverlayForm(QPDF& out, const Overlay& overlay);
    QPDFObjectHandle getImage(QPDF& out, const std::shared_ptr<const RasterImage>& image);
    void setDocumentInfo(QPDF& out);
    void resetState();

    bool overwrite_;
    std::string lastError_;

    // Per-write state
    std::map<const RasterImage*, QPDFObjectHandle> images_;
    QPDFObjectHandle resources_;
};

namespace PdfUtil {
    // Case-insensitive ".pdf" extension check
    bool is_pdf_filename(const std::string& path);

    // File starts with the "%PDF" magic bytes
    bool has_pdf_signature(const std::string& path);

    // Temporary sibling of target in the same directory (for rename into place)
    std::string temp_path_for(const std::string& target);
}

#endif // PDF_CONTAINER_H
