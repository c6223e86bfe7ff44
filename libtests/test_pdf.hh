#ifndef TEST_PDF_HH
#define TEST_PDF_HH

// Helpers shared by the test programs for creating small PDF files
// with known text.

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <cstdio>
#include <string>
#include <vector>

inline QPDFObjectHandle
test_pdf_font(QPDF& pdf)
{
    return pdf.makeIndirectObject("<<"
                                  " /Type /Font"
                                  " /Subtype /Type1"
                                  " /BaseFont /Helvetica"
                                  " /Encoding /WinAnsiEncoding"
                                  ">>"_qpdf);
}

// Add a page whose content stream is exactly contents. The page's
// resources have Helvetica as /F1 and, if xobjects is not null, the
// given /XObject dictionary.
inline void
test_pdf_add_page(
    QPDF& pdf,
    QPDFObjectHandle font,
    std::string const& contents,
    QPDFObjectHandle xobjects = QPDFObjectHandle::newNull())
{
    auto rfont = QPDFObjectHandle::newDictionary();
    rfont.replaceKey("/F1", font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", rfont);
    if (xobjects.isDictionary()) {
        resources.replaceKey("/XObject", xobjects);
    }
    auto page = pdf.makeIndirectObject("<<"
                                       " /Type /Page"
                                       " /MediaBox [0 0 612 792]"
                                       ">>"_qpdf);
    page.replaceKey("/Contents", pdf.newStream(contents));
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(page, false);
}

inline void
test_pdf_write(QPDF& pdf, std::string const& filename)
{
    QPDFWriter w(pdf, filename.c_str());
    w.setDeterministicID(true);
    // Pass stream data through as given so that deliberately damaged
    // streams stay damaged.
    w.setDecodeLevel(qpdf_dl_none);
    w.write();
}

// Write a PDF with one page for each element of lines. Each page shows
// its text in a single Tj. The text is copied into a literal string
// as is, so it may contain escapes such as \222 but no unbalanced
// parentheses.
inline void
test_pdf_create(std::string const& filename, std::vector<std::string> const& lines)
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);
    for (auto const& line: lines) {
        test_pdf_add_page(pdf, font, "BT /F1 24 Tf 72 720 Td (" + line + ") Tj ET\n");
    }
    test_pdf_write(pdf, filename);
}

// Write a PDF with n pages whose text is "This is page <n>".
inline void
test_pdf_create_numbered(std::string const& filename, int n)
{
    std::vector<std::string> lines;
    for (int i = 1; i <= n; ++i) {
        lines.push_back("This is page " + std::to_string(i));
    }
    test_pdf_create(filename, lines);
}

// Write a PDF with n pages like test_pdf_create_numbered, except that
// the content stream of page bad_page can't be decoded.
inline void
test_pdf_create_damaged(std::string const& filename, int n, int bad_page)
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);
    for (int i = 1; i <= n; ++i) {
        test_pdf_add_page(
            pdf, font, "BT /F1 24 Tf 72 720 Td (This is page " + std::to_string(i) + ") Tj ET\n");
    }
    auto page = QPDFPageDocumentHelper(pdf).getAllPages().at(static_cast<size_t>(bad_page - 1));
    page.getObjectHandle().getKey("/Contents").replaceStreamData(
        "this is not zlib data", "/FlateDecode"_qpdf, QPDFObjectHandle::newNull());
    test_pdf_write(pdf, filename);
}

// Write a one-page PDF encrypted with the given user password and an
// owner password of "owner".
inline void
test_pdf_create_encrypted(std::string const& filename, char const* user_password)
{
    QPDF pdf;
    pdf.emptyPDF();
    test_pdf_add_page(pdf, test_pdf_font(pdf), "BT /F1 24 Tf 72 720 Td (Secret) Tj ET\n");
    QPDFWriter w(pdf, filename.c_str());
    w.setDeterministicID(true);
    w.setR6EncryptionParameters(
        user_password, "owner", true, true, true, true, true, true, qpdf_r3p_full, true);
    w.write();
}

inline int
test_pdf_count_pages(std::string const& filename)
{
    QPDF pdf;
    pdf.processFile(filename.c_str());
    return static_cast<int>(QPDFPageDocumentHelper(pdf).getAllPages().size());
}

inline bool
test_file_exists(std::string const& filename)
{
    FILE* f = fopen(filename.c_str(), "rb");
    if (f == nullptr) {
        return false;
    }
    fclose(f);
    return true;
}

#endif // TEST_PDF_HH
