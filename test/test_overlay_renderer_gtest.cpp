#include <gtest/gtest.h>
#include "overlay_renderer.h"
#include "test_helpers.h"

#include <fstream>

// Test suite for title and watermark overlays

static const PageSize LETTER(612, 792);

TEST(OverlayRendererTest, TitleFontSizeIsCappedByPageWidth) {
    OverlayRenderer renderer;
    EXPECT_DOUBLE_EQ(renderer.titleFontSizeFor(LETTER), 36.0);
    EXPECT_DOUBLE_EQ(renderer.titleFontSizeFor(PageSize(320, 400)), 20.0);

    OverlayRenderer small(24, 12);
    EXPECT_DOUBLE_EQ(small.titleFontSizeFor(LETTER), 24.0);
}

TEST(OverlayRendererTest, WatermarkFontSizeIsCappedByPageWidth) {
    OverlayRenderer renderer;
    EXPECT_DOUBLE_EQ(renderer.watermarkFontSizeFor(LETTER), 12.0);
    EXPECT_DOUBLE_EQ(renderer.watermarkFontSizeFor(PageSize(300, 400)), 6.0);
}

TEST(OverlayRendererTest, TextOnlyTitle) {
    OverlayRenderer renderer;
    Overlay overlay = renderer.renderTitle("Report", LETTER);

    EXPECT_EQ(overlay.size, LETTER);
    EXPECT_EQ(overlay.image, nullptr);
    EXPECT_NE(overlay.content.find("/F2 36 Tf"), std::string::npos);
    EXPECT_NE(overlay.content.find(" 396 Td"), std::string::npos);  // vertically centered
    EXPECT_NE(overlay.content.find("(Report) Tj"), std::string::npos);
    EXPECT_EQ(overlay.content.find("/Im1"), std::string::npos);
}

TEST(OverlayRendererTest, WatermarkCorners) {
    OverlayRenderer renderer;

    Overlay front = renderer.renderWatermark("3 | a.pdf", LETTER, StampCorner::BOTTOM_RIGHT);
    EXPECT_NE(front.content.find("/GS1 gs"), std::string::npos);
    EXPECT_NE(front.content.find("0.5 g"), std::string::npos);
    EXPECT_NE(front.content.find("/F1 12 Tf"), std::string::npos);
    EXPECT_NE(front.content.find(" 15 Td"), std::string::npos);
    EXPECT_NE(front.content.find("(3 | a.pdf) Tj"), std::string::npos);

    Overlay back = renderer.renderWatermark("4 | a.pdf", LETTER, StampCorner::TOP_LEFT);
    EXPECT_NE(back.content.find("10 777 Td"), std::string::npos);
}

TEST(OverlayRendererTest, WatermarkText) {
    EXPECT_EQ(watermark_text(5, "minutes.pdf"), "5 | minutes.pdf");
}

TEST(OverlayRendererTest, MissingIllustrationFallsBackToText) {
    OverlayRenderer renderer;
    EXPECT_FALSE(renderer.loadIllustration("/nonexistent/frontpage.png"));
    EXPECT_FALSE(renderer.getLastError().empty());
    EXPECT_FALSE(renderer.hasIllustration());

    Overlay overlay = renderer.renderTitle("Report", LETTER);
    EXPECT_EQ(overlay.image, nullptr);
}

TEST(OverlayRendererTest, IllustrationIsPlacedBelowTitle) {
    ScopedTempDir dir;
    std::string image_path = dir.file("frontpage.ppm");
    {
        std::ofstream ppm(image_path, std::ios::binary);
        ppm << "P6\n2 2\n255\n";
        const unsigned char pixels[12] = {255, 0, 0, 0, 255, 0, 0, 0, 255, 255, 255, 255};
        ppm.write(reinterpret_cast<const char*>(pixels), sizeof(pixels));
    }

    OverlayRenderer renderer;
    ASSERT_TRUE(renderer.loadIllustration(image_path)) << renderer.getLastError();
    EXPECT_TRUE(renderer.hasIllustration());

    Overlay overlay = renderer.renderTitle("Report", LETTER);
    ASSERT_NE(overlay.image, nullptr);
    EXPECT_EQ(overlay.image->width, 2);
    EXPECT_EQ(overlay.image->height, 2);
    EXPECT_TRUE(overlay.image->is_valid());
    EXPECT_FALSE(overlay.image->alpha.empty());

    // Small images are not upscaled; title sits 40 units above the image
    EXPECT_NE(overlay.content.find("2 0 0 2 305 276.2 cm"), std::string::npos);
    EXPECT_NE(overlay.content.find("/Im1 Do"), std::string::npos);
    EXPECT_NE(overlay.content.find(" 318.2 Td"), std::string::npos);
}

TEST(OverlayUtilTest, EscapePdfString) {
    EXPECT_EQ(OverlayUtil::escape_pdf_string("a(b)c\\"), "a\\(b\\)c\\\\");
    EXPECT_EQ(OverlayUtil::escape_pdf_string("caf\xC3\xA9"), "caf\\351");
    EXPECT_EQ(OverlayUtil::escape_pdf_string("plain"), "plain");
}

TEST(OverlayUtilTest, WinAnsiEncoding) {
    using OverlayUtil::to_win_ansi;
    EXPECT_EQ(to_win_ansi("R\xC3\xA9sum\xC3\xA9.pdf"), "R\xE9sum\xE9.pdf");
    EXPECT_EQ(to_win_ansi("Stra\xC3\x9F" "e"), "Stra\xDF" "e");
    EXPECT_EQ(to_win_ansi("\xE2\x82\xAC 5"), "\x80 5");          // euro sign
    EXPECT_EQ(to_win_ansi("\xE2\x80\x93"), "\x96");              // en dash
    EXPECT_EQ(to_win_ansi("\xE6\x97\xA5"), "?");                  // not in WinAnsi
    EXPECT_EQ(to_win_ansi("a\xFF" "b"), "a?b");                   // malformed byte
    EXPECT_EQ(to_win_ansi("a\xC3"), "a?");                        // truncated sequence
    EXPECT_EQ(to_win_ansi("tab\there"), "tab?here");
}

TEST(OverlayRendererTest, AccentedTitleUsesFontEncoding) {
    OverlayRenderer renderer;
    Overlay overlay = renderer.renderTitle("R\xC3\xA9sum\xC3\xA9", LETTER);
    EXPECT_NE(overlay.content.find("(R\\351sum\\351) Tj"), std::string::npos);
    EXPECT_EQ(overlay.content.find("??"), std::string::npos);
}

TEST(OverlayUtilTest, FormatNumber) {
    EXPECT_EQ(OverlayUtil::format_number(300), "300");
    EXPECT_EQ(OverlayUtil::format_number(12.5), "12.5");
    EXPECT_EQ(OverlayUtil::format_number(0.004), "0");
    EXPECT_EQ(OverlayUtil::format_number(-0.001), "0");
}

TEST(OverlayUtilTest, TextWidthScalesWithFontSize) {
    double w12 = OverlayUtil::approximate_text_width("Page 12", 12, false);
    double w24 = OverlayUtil::approximate_text_width("Page 12", 24, false);
    EXPECT_GT(w12, 0);
    EXPECT_DOUBLE_EQ(w24, 2 * w12);
    EXPECT_GT(OverlayUtil::approximate_text_width("Page", 12, true),
              OverlayUtil::approximate_text_width("Page", 12, false));

    // One glyph per character, not per UTF-8 byte
    EXPECT_DOUBLE_EQ(OverlayUtil::approximate_text_width("caf\xC3\xA9", 12, false),
                     OverlayUtil::approximate_text_width("cafe", 12, false));
}

TEST(OverlayUtilTest, CompressZlib) {
    std::vector<unsigned char> data(1000, 'x');
    std::vector<unsigned char> compressed = OverlayUtil::compress_zlib(data);
    EXPECT_FALSE(compressed.empty());
    EXPECT_LT(compressed.size(), data.size());
}
