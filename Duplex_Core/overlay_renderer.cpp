#include "overlay_renderer.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <zlib.h>

// stb_image - image loading
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

// Title layout: image height and drop as fractions of the page height
static constexpr double ILLUSTRATION_MAX_HEIGHT = 0.6;
static constexpr double ILLUSTRATION_DROP = 0.15;
static constexpr double TITLE_ILLUSTRATION_SPACING = 40;

// Watermark margins from the page edge
static constexpr double STAMP_MARGIN_X = 10;
static constexpr double STAMP_MARGIN_Y = 15;

namespace OverlayUtil {

// Unicode code points in the 0x80-0x9F block of WinAnsiEncoding
static const struct { unsigned int codepoint; unsigned char code; } WIN_ANSI_EXTRA[] = {
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
    {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
    {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
    {0x017E, 0x9E}, {0x0178, 0x9F},
};

static char win_ansi_code(unsigned int cp) {
    if (cp >= 0x20 && cp < 0x7F) return static_cast<char>(cp);
    if (cp >= 0xA0 && cp <= 0xFF) return static_cast<char>(cp);
    for (const auto& entry : WIN_ANSI_EXTRA) {
        if (entry.codepoint == cp) return static_cast<char>(entry.code);
    }
    return '?';
}

std::string to_win_ansi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char lead = static_cast<unsigned char>(utf8[i]);
        size_t length = 0;
        unsigned int cp = 0;
        if (lead < 0x80) {
            length = 1;
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        }

        bool valid = length > 0 && i + length <= utf8.size();
        for (size_t k = 1; valid && k < length; ++k) {
            unsigned char cont = static_cast<unsigned char>(utf8[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }

        if (!valid) {
            // Stray or truncated sequence: one replacement per byte
            out += '?';
            ++i;
            continue;
        }
        out += win_ansi_code(cp);
        i += length;
    }
    return out;
}

std::string escape_pdf_string(const std::string& text) {
    std::string encoded = to_win_ansi(text);
    std::string out;
    out.reserve(encoded.size());
    for (unsigned char c : encoded) {
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c >= 0x80) {
            char octal[5];
            std::snprintf(octal, sizeof(octal), "\\%03o", static_cast<unsigned int>(c));
            out += octal;
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

double approximate_text_width(const std::string& text, double fontSize, bool bold) {
    static const char* narrow = "iljtfI.,;:!|' ";
    double em = 0;
    for (unsigned char c : to_win_ansi(text)) {
        if (std::strchr(narrow, c) != nullptr && c != '\0') {
            em += bold ? 0.278 : 0.25;
        } else if (c >= 'A' && c <= 'Z') {
            em += bold ? 0.722 : 0.667;
        } else if (c == 'm' || c == 'w' || c == 'M' || c == 'W') {
            em += 0.833;
        } else {
            em += bold ? 0.611 : 0.556;
        }
    }
    return em * fontSize;
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    std::string s = ss.str();
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

std::vector<unsigned char> compress_zlib(const std::vector<unsigned char>& data) {
    std::vector<unsigned char> compressed;
    uLongf compressed_size = compressBound(static_cast<uLong>(data.size()));
    compressed.resize(compressed_size);

    int result = compress(compressed.data(), &compressed_size, data.data(),
                          static_cast<uLong>(data.size()));
    if (result != Z_OK) {
        return {};
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::shared_ptr<const RasterImage> load_raster_image(const std::string& path, std::string& error) {
    int width = 0, height = 0, channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &width, &height, &channels, 4); // Force RGBA
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        error = "Could not load image " + path + (reason ? std::string(": ") + reason : "");
        return nullptr;
    }

    // Separate RGB and Alpha
    std::vector<unsigned char> rgb_data, alpha_data;
    size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
    rgb_data.reserve(pixel_count * 3);
    alpha_data.reserve(pixel_count);
    for (size_t i = 0; i < pixel_count * 4; i += 4) {
        rgb_data.push_back(pixels[i]);
        rgb_data.push_back(pixels[i + 1]);
        rgb_data.push_back(pixels[i + 2]);
        alpha_data.push_back(pixels[i + 3]);
    }
    stbi_image_free(pixels);

    auto image = std::make_shared<RasterImage>();
    image->width = width;
    image->height = height;
    image->rgb = compress_zlib(rgb_data);
    image->alpha = compress_zlib(alpha_data);
    if (image->rgb.empty() || image->alpha.empty()) {
        error = "Could not compress image data for " + path;
        return nullptr;
    }
    return image;
}

} // namespace OverlayUtil

// ============================================================================
// OverlayRenderer
// ============================================================================

OverlayRenderer::OverlayRenderer(int titleFontSize, int numberFontSize)
    : titleFontSize_(titleFontSize), numberFontSize_(numberFontSize) {
}

bool OverlayRenderer::loadIllustration(const std::string& path) {
    std::string error;
    auto image = OverlayUtil::load_raster_image(path, error);
    if (!image) {
        lastError_ = error;
        return false;
    }
    illustration_ = image;
    return true;
}

double OverlayRenderer::titleFontSizeFor(PageSize size) const {
    return std::min(static_cast<double>(titleFontSize_), size.width / 16.0);
}

double OverlayRenderer::watermarkFontSizeFor(PageSize size) const {
    return std::min(static_cast<double>(numberFontSize_), size.width / 50.0);
}

Overlay OverlayRenderer::renderTitle(const std::string& title, PageSize size) const {
    using OverlayUtil::format_number;

    Overlay overlay;
    overlay.size = size;

    double font_size = titleFontSizeFor(size);
    double text_width = OverlayUtil::approximate_text_width(title, font_size, true);
    double text_x = (size.width - text_width) / 2;
    double text_y = size.height / 2;

    std::ostringstream content;
    if (illustration_) {
        // Scale to fit (max height: 60% of page, maintain aspect ratio), never upscale
        double max_img_height = size.height * ILLUSTRATION_MAX_HEIGHT;
        double scale = std::min(max_img_height / illustration_->height, 1.0);
        double scaled_width = illustration_->width * scale;
        double scaled_height = illustration_->height * scale;

        double img_x = (size.width - scaled_width) / 2;
        double img_y = (size.height - scaled_height) / 2 - size.height * ILLUSTRATION_DROP;
        text_y = img_y + scaled_height + TITLE_ILLUSTRATION_SPACING;

        content << "q\n"
                << format_number(scaled_width) << " 0 0 " << format_number(scaled_height) << " "
                << format_number(img_x) << " " << format_number(img_y) << " cm\n"
                << "/Im1 Do\nQ\n";
        overlay.image = illustration_;
    }

    content << "BT\n0 g\n/F2 " << format_number(font_size) << " Tf\n"
            << format_number(text_x) << " " << format_number(text_y) << " Td\n"
            << "(" << OverlayUtil::escape_pdf_string(title) << ") Tj\nET\n";

    overlay.content = content.str();
    return overlay;
}

Overlay OverlayRenderer::renderWatermark(const std::string& text, PageSize size,
                                         StampCorner corner) const {
    using OverlayUtil::format_number;

    Overlay overlay;
    overlay.size = size;

    double font_size = watermarkFontSizeFor(size);
    double x = STAMP_MARGIN_X;
    double y = size.height - STAMP_MARGIN_Y;
    if (corner == StampCorner::BOTTOM_RIGHT) {
        // Right-align against the margin
        x = size.width - STAMP_MARGIN_X -
            OverlayUtil::approximate_text_width(text, font_size, false);
        y = STAMP_MARGIN_Y;
    }

    std::ostringstream content;
    content << "q\n/GS1 gs\n0.5 g\nBT\n/F1 " << format_number(font_size) << " Tf\n"
            << format_number(x) << " " << format_number(y) << " Td\n"
            << "(" << OverlayUtil::escape_pdf_string(text) << ") Tj\nET\nQ\n";

    overlay.content = content.str();
    return overlay;
}

std::string watermark_text(int pageNumber, const std::string& documentName) {
    return std::to_string(pageNumber) + " | " + documentName;
}
