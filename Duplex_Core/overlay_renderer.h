// Overlay rendering for title pages and provenance watermarks.
// Produces PDF content-stream overlays; illustrations are decoded with
// stb_image and compressed with zlib for embedding as image XObjects.

#ifndef OVERLAY_RENDERER_H
#define OVERLAY_RENDERER_H

#include "page_model.h"

#include <memory>
#include <string>
#include <vector>

enum class StampCorner {
    BOTTOM_RIGHT,   // front pages
    TOP_LEFT        // back pages, reads bottom-right once the sheet is turned
};

class OverlayRenderer {
public:
    OverlayRenderer(int titleFontSize = 36, int numberFontSize = 12);

    // Load the title-page illustration (PNG, JPG, ...). Returns false and
    // keeps text-only rendering when the image is missing or unreadable.
    bool loadIllustration(const std::string& path);
    bool hasIllustration() const { return illustration_ != nullptr; }

    // Title overlay: filename centered, illustration below it when loaded
    Overlay renderTitle(const std::string& title, PageSize size) const;

    // Small grey "{page} | {name}" mark in the given corner
    Overlay renderWatermark(const std::string& text, PageSize size, StampCorner corner) const;

    double titleFontSizeFor(PageSize size) const;
    double watermarkFontSizeFor(PageSize size) const;

    const std::string& getLastError() const { return lastError_; }

private:
    int titleFontSize_;
    int numberFontSize_;
    std::shared_ptr<const RasterImage> illustration_;
    std::string lastError_;
};

std::string watermark_text(int pageNumber, const std::string& documentName);

namespace OverlayUtil {
    // UTF-8 to single-byte WinAnsiEncoding (the overlay fonts' encoding).
    // Characters the encoding lacks, control characters and malformed bytes become '?'.
    std::string to_win_ansi(const std::string& utf8);

    // WinAnsi-encoded PDF literal string body; bytes >= 0x80 as octal escapes
    std::string escape_pdf_string(const std::string& text);

    // Approximate Helvetica advance width of UTF-8 text
    double approximate_text_width(const std::string& text, double fontSize, bool bold);

    // Fixed-point number for content streams ("12.5", "300")
    std::string format_number(double value);

    // Compress data using zlib (for PDF streams)
    std::vector<unsigned char> compress_zlib(const std::vector<unsigned char>& data);

    // Decode an image file to RGB + alpha planes, both zlib-compressed
    std::shared_ptr<const RasterImage> load_raster_image(const std::string& path, std::string& error);
}

#endif // OVERLAY_RENDERER_H
