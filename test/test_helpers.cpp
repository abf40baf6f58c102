#include "test_helpers.h"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

static std::atomic<int> temp_counter(0);

ScopedTempDir::ScopedTempDir() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now().time_since_epoch()).count();
    fs::path dir = fs::temp_directory_path() /
                   ("duplex_test_" + std::to_string(static_cast<long>(getpid())) + "_" +
                    std::to_string(ms) + "_" + std::to_string(temp_counter++));
    fs::create_directories(dir);
    path_ = dir.string();
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string ScopedTempDir::file(const std::string& name) const {
    return (fs::path(path_) / name).string();
}

PageSequence make_sequence(int documentId, int count, PageSize size) {
    PageSequence pages;
    for (int i = 1; i <= count; ++i) {
        SequencedPage sp;
        sp.page = Page::synthetic(size);
        sp.provenance = Provenance::original(documentId, i);
        pages.push_back(sp);
    }
    return pages;
}

Document make_document(int documentId, const std::string& name, int count, PageSize size) {
    Document doc;
    doc.id = documentId;
    doc.displayName = name;
    doc.sourcePath = name;
    doc.originalPageCount = count;
    doc.pages = make_sequence(documentId, count, size);
    return doc;
}

std::vector<int> page_numbers(const PageSequence& pages) {
    std::vector<int> numbers;
    for (const auto& sp : pages) {
        numbers.push_back(sp.provenance.isSynthetic() ? 0 : sp.provenance.pageNumber);
    }
    return numbers;
}

std::string create_test_pdf(const std::string& path, int pages, PageSize size, int rotate) {
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper dh(pdf);

    QPDFObjectHandle font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"));

    for (int i = 1; i <= pages; ++i) {
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/Font", QPDFObjectHandle::newDictionary());
        resources.getKey("/Font").replaceKey("/F1", font);

        std::string content = "BT /F1 24 Tf 72 72 Td (Page " + std::to_string(i) + ") Tj ET\n";

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle(
                                         QPDFObjectHandle::Rectangle(0, 0, size.width, size.height)));
        page.replaceKey("/Resources", resources);
        page.replaceKey("/Contents", pdf.newStream(content));
        page.replaceKey("/TestPageNumber", QPDFObjectHandle::newInteger(i));
        if (rotate != 0) {
            page.replaceKey("/Rotate", QPDFObjectHandle::newInteger(rotate));
        }
        dh.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
    }

    QPDFWriter writer(pdf, path.c_str());
    writer.write();
    return path;
}

std::vector<ReadBackPage> read_back(const std::string& path) {
    QPDF pdf;
    pdf.processFile(path.c_str());

    std::vector<ReadBackPage> result;
    for (auto& ph : QPDFPageDocumentHelper(pdf).getAllPages()) {
        QPDFObjectHandle page = ph.getObjectHandle();
        ReadBackPage rb;

        QPDFObjectHandle number = page.getKey("/TestPageNumber");
        if (number.isInteger()) rb.testNumber = number.getIntValueAsInt();

        QPDFObjectHandle rotate = page.getKey("/Rotate");
        if (rotate.isInteger()) rb.rotation = rotate.getIntValueAsInt();

        QPDFObjectHandle mediabox = page.getKey("/MediaBox");
        if (mediabox.isRectangle()) {
            QPDFObjectHandle::Rectangle rect = mediabox.getArrayAsRectangle();
            rb.size = PageSize(rect.urx - rect.llx, rect.ury - rect.lly);
        }

        QPDFObjectHandle resources = page.getKey("/Resources");
        if (resources.isDictionary() && resources.getKey("/XObject").isDictionary()) {
            rb.xobjectCount = static_cast<int>(resources.getKey("/XObject").getKeys().size());
        }
        result.push_back(rb);
    }
    return result;
}

std::vector<int> read_back_numbers(const std::string& path) {
    std::vector<int> numbers;
    for (const auto& rb : read_back(path)) numbers.push_back(rb.testNumber);
    return numbers;
}

std::vector<std::string> list_files(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}
