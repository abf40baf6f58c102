#include "pdf_container.h"

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

// Shared overlay resources; content streams from OverlayRenderer refer to these names
static const char* OVERLAY_FONT_REGULAR =
    "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>";
static const char* OVERLAY_FONT_BOLD =
    "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>";
static const char* OVERLAY_GSTATE = "<< /Type /ExtGState /ca 0.7 /CA 0.7 >>";

// ============================================================================
// PdfUtil
// ============================================================================

namespace PdfUtil {

bool is_pdf_filename(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::string ext_lower;
    for (char c : ext) ext_lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext_lower == ".pdf";
}

bool has_pdf_signature(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    char magic[4] = {0};
    file.read(magic, 4);
    return file.gcount() == 4 && magic[0] == '%' && magic[1] == 'P' &&
           magic[2] == 'D' && magic[3] == 'F';
}

std::string temp_path_for(const std::string& target) {
    fs::path output_dir = fs::path(target).parent_path();
    if (output_dir.empty()) output_dir = fs::current_path();

    auto now = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto pid = static_cast<long>(getpid());
    return (output_dir / ("_duplex_" + std::to_string(pid) + "_" + std::to_string(ms) +
                          "_" + fs::path(target).filename().string() + ".tmp")).string();
}

} // namespace PdfUtil

// ============================================================================
// PdfSource
// ============================================================================

PdfSource::PdfSource() : pdf_(new QPDF()) {
}

bool PdfSource::load(const std::string& filename) {
    filename_ = filename;
    pages_.clear();

    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        lastError_ = "Cannot open file: " + filename;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();
    if (buffer.fail()) {
        lastError_ = "Cannot read file: " + filename;
        return false;
    }
    data_ = buffer.str();

    try {
        pdf_->processMemoryFile(filename.c_str(), data_.data(), data_.size());

        // Copy inherited /MediaBox, /Rotate and /Resources onto each page so
        // pages can be moved into another document on their own
        QPDFPageDocumentHelper dh(*pdf_);
        dh.pushInheritedAttributesToPage();
        pages_ = dh.getAllPages();
    } catch (const std::exception& e) {
        lastError_ = "Could not open PDF " + filename + ": " + e.what();
        pages_.clear();
        return false;
    }
    return true;
}

PageSize PdfSource::getPageSize(int index) const {
    PageSize size;
    QPDFObjectHandle mediabox = pages_.at(index).getObjectHandle().getKey("/MediaBox");
    if (mediabox.isRectangle()) {
        QPDFObjectHandle::Rectangle rect = mediabox.getArrayAsRectangle();
        double w = rect.urx - rect.llx;
        double h = rect.ury - rect.lly;
        if (w > 0 && h > 0) {
            size.width = w;
            size.height = h;
        }
    }
    return size;
}

int PdfSource::getPageRotation(int index) const {
    QPDFObjectHandle rotate_obj = pages_.at(index).getObjectHandle().getKey("/Rotate");
    if (rotate_obj.isInteger()) {
        return normalize_rotation(rotate_obj.getIntValueAsInt());
    }
    return 0;
}

bool load_document(const std::string& path, int documentId, Document& document,
                   std::string& error) {
    if (!PdfUtil::is_pdf_filename(path)) {
        error = "Not a .pdf file: " + path;
        return false;
    }
    if (!fs::is_regular_file(path)) {
        error = "File not found: " + path;
        return false;
    }
    if (!PdfUtil::has_pdf_signature(path)) {
        error = "Missing %PDF signature: " + path;
        return false;
    }

    auto source = std::make_shared<PdfSource>();
    if (!source->load(path)) {
        error = source->getLastError();
        return false;
    }

    document.id = documentId;
    document.displayName = fs::path(path).filename().string();
    document.sourcePath = path;
    document.originalPageCount = source->getPageCount();
    document.pages.clear();
    document.pages.reserve(source->getPageCount());
    for (int i = 0; i < source->getPageCount(); ++i) {
        SequencedPage sp;
        sp.page = Page::fromSource(source, i, source->getPageSize(i), source->getPageRotation(i));
        sp.provenance = Provenance::original(documentId, i + 1);
        document.pages.push_back(sp);
    }
    return true;
}

// ============================================================================
// PdfPageWriter
// ============================================================================

namespace {

// Removes the temporary output unless it was handed off
class TempFileGuard {
public:
    explicit TempFileGuard(const std::string& path) : path_(path), released_(false) {}
    ~TempFileGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    void release() { released_ = true; }

private:
    std::string path_;
    bool released_;
};

} // namespace

PdfPageWriter::PdfPageWriter() : overwrite_(false) {
}

bool PdfPageWriter::write(const PageSequence& pages, const std::string& outputFile) {
    lastError_.clear();

    if (fs::exists(outputFile)) {
        if (!overwrite_) {
            lastError_ = "Output file already exists: " + outputFile +
                         " (use --Overwrite to replace it)";
            return false;
        }
        std::cerr << "WARNING: Overwriting existing file: " << outputFile << "\n";
    }

    std::string temp = PdfUtil::temp_path_for(outputFile);
    TempFileGuard guard(temp);

    try {
        // Scope the QPDF objects so all file handles are released before the rename
        {
            QPDF out;
            out.emptyPDF();

            images_.clear();
            resources_ = QPDFObjectHandle::newDictionary();
            resources_.replaceKey("/Font", QPDFObjectHandle::newDictionary());
            resources_.getKey("/Font").replaceKey(
                "/F1", out.makeIndirectObject(QPDFObjectHandle::parse(OVERLAY_FONT_REGULAR)));
            resources_.getKey("/Font").replaceKey(
                "/F2", out.makeIndirectObject(QPDFObjectHandle::parse(OVERLAY_FONT_BOLD)));
            resources_.replaceKey("/ExtGState", QPDFObjectHandle::newDictionary());
            resources_.getKey("/ExtGState").replaceKey(
                "/GS1", out.makeIndirectObject(QPDFObjectHandle::parse(OVERLAY_GSTATE)));

            for (const auto& sp : pages) {
                addPage(out, sp);
            }
            setDocumentInfo(out);

            QPDFWriter writer(out, temp.c_str());
            writer.write();
        }
    } catch (const std::exception& e) {
        lastError_ = "Could not write " + outputFile + ": " + e.what();
        resetState();
        return false;
    }
    resetState();

    std::error_code ec;
    fs::rename(temp, outputFile, ec);
    if (ec) {
        lastError_ = "Could not move " + temp + " to " + outputFile + ": " + ec.message();
        return false;
    }
    guard.release();
    return true;
}

void PdfPageWriter::resetState() {
    images_.clear();
    resources_ = QPDFObjectHandle();
}

void PdfPageWriter::addPage(QPDF& out, const SequencedPage& sp) {
    const Page& page = sp.page;
    QPDFObjectHandle page_oh;

    if (page.isSourcePage()) {
        QPDFObjectHandle foreign = page.getSource()->getPageHelper(page.getSourceIndex())
                                       .getObjectHandle();
        // The copied page stays untouched; each occurrence gets its own page
        // dictionary for rotation and overlays
        QPDFObjectHandle copied = out.copyForeignObject(foreign);
        page_oh = out.makeIndirectObject(copied.shallowCopy());
    } else {
        page_oh = makeSyntheticPage(out, page);
    }

    QPDFPageObjectHelper ph(page_oh);
    ph.rotatePage(page.getRotation(), false);
    applyOverlays(out, page_oh, page);

    QPDFPageDocumentHelper(out).addPage(ph, false);
}

QPDFObjectHandle PdfPageWriter::makeSyntheticPage(QPDF& out, const Page& page) {
    const PageSize& size = page.getSize();
    QPDFObjectHandle page_oh = QPDFObjectHandle::newDictionary();
    page_oh.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page_oh.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle(
                                        QPDFObjectHandle::Rectangle(0, 0, size.width, size.height)));
    page_oh.replaceKey("/Resources", QPDFObjectHandle::newDictionary());
    page_oh.replaceKey("/Contents", out.newStream(std::string()));
    return out.makeIndirectObject(page_oh);
}

void PdfPageWriter::applyOverlays(QPDF& out, QPDFObjectHandle page_oh, const Page& page) {
    if (page.getOverlays().empty()) return;

    // Detach shared dictionaries before adding names to them
    QPDFObjectHandle resources = page_oh.getKey("/Resources");
    resources = resources.isDictionary() ? resources.shallowCopy()
                                         : QPDFObjectHandle::newDictionary();
    page_oh.replaceKey("/Resources", resources);

    QPDFObjectHandle xobjects = resources.getKey("/XObject");
    xobjects = xobjects.isDictionary() ? xobjects.shallowCopy()
                                       : QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    double llx = 0, lly = 0;
    QPDFObjectHandle mediabox = page_oh.getKey("/MediaBox");
    if (mediabox.isRectangle()) {
        QPDFObjectHandle::Rectangle rect = mediabox.getArrayAsRectangle();
        llx = rect.llx;
        lly = rect.lly;
    }

    std::ostringstream draw;
    draw << "\nQ\n";
    int min_suffix = 1;
    for (const auto& overlay : page.getOverlays()) {
        std::string name = resources.getUniqueResourceName("/Dx", min_suffix);
        xobjects.replaceKey(name, makeOverlayForm(out, overlay));
        draw << "q 1 0 0 1 " << llx << " " << lly << " cm " << name << " Do Q\n";
    }

    // Isolate the existing content's graphics state from the overlays
    QPDFPageObjectHelper ph(page_oh);
    ph.addPageContents(out.newStream("q\n"), true);
    ph.addPageContents(out.newStream(draw.str()), false);
}

QPDFObjectHandle PdfPageWriter::makeOverlayForm(QPDF& out, const Overlay& overlay) {
    QPDFObjectHandle resources = resources_.shallowCopy();
    if (overlay.image) {
        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Im1", getImage(out, overlay.image));
        resources.replaceKey("/XObject", xobjects);
    }

    QPDFObjectHandle form = out.newStream(overlay.content);
    QPDFObjectHandle dict = form.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    dict.replaceKey("/BBox", QPDFObjectHandle::newFromRectangle(
                                 QPDFObjectHandle::Rectangle(0, 0, overlay.size.width,
                                                             overlay.size.height)));
    dict.replaceKey("/Resources", resources);
    return form;
}

QPDFObjectHandle PdfPageWriter::getImage(QPDF& out, const std::shared_ptr<const RasterImage>& image) {
    auto it = images_.find(image.get());
    if (it != images_.end()) return it->second;

    auto make_plane = [&out, &image](const std::vector<unsigned char>& data, const char* colorspace) {
        QPDFObjectHandle stream = out.newStream();
        stream.replaceStreamData(std::string(data.begin(), data.end()),
                                 QPDFObjectHandle::newName("/FlateDecode"),
                                 QPDFObjectHandle::newNull());
        QPDFObjectHandle dict = stream.getDict();
        dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
        dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
        dict.replaceKey("/Width", QPDFObjectHandle::newInteger(image->width));
        dict.replaceKey("/Height", QPDFObjectHandle::newInteger(image->height));
        dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(colorspace));
        dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
        return stream;
    };

    QPDFObjectHandle img = make_plane(image->rgb, "/DeviceRGB");
    if (!image->alpha.empty()) {
        img.getDict().replaceKey("/SMask", make_plane(image->alpha, "/DeviceGray"));
    }
    images_[image.get()] = img;
    return img;
}

void PdfPageWriter::setDocumentInfo(QPDF& out) {
    QPDFObjectHandle trailer = out.getTrailer();
    QPDFObjectHandle info;
    if (trailer.hasKey("/Info") && trailer.getKey("/Info").isDictionary()) {
        info = trailer.getKey("/Info");
    } else {
        info = out.makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", info);
    }
    info.replaceKey("/Producer", QPDFObjectHandle::newString("DuplexPrep"));
    info.replaceKey("/Creator", QPDFObjectHandle::newString("DuplexPrep manual duplex preparation"));
}
