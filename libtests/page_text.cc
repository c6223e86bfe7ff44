#include <pdfslice/assert_test.h>

#include "test_pdf.hh"

#include <pdfslice/PDFSliceExc.hh>
#include <pdfslice/PDFSlicePageText.hh>
#include <pdfslice/Util.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pdfslice;

static QPDFObjectHandle
make_form(QPDF& pdf, QPDFObjectHandle font, std::string const& contents)
{
    auto form = pdf.newStream(contents);
    form.replaceDict("<<"
                     " /Type /XObject"
                     " /Subtype /Form"
                     " /BBox [0 0 612 792]"
                     ">>"_qpdf);
    auto rfont = QPDFObjectHandle::newDictionary();
    rfont.replaceKey("/F1", font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", rfont);
    form.getDict().replaceKey("/Resources", resources);
    return form;
}

static QPDFObjectHandle
make_image(QPDF& pdf)
{
    auto image = pdf.newStream(std::string(4 * 4, '\x7f'));
    image.replaceDict("<<"
                      " /Type /XObject"
                      " /Subtype /Image"
                      " /Width 4"
                      " /Height 4"
                      " /ColorSpace /DeviceGray"
                      " /BitsPerComponent 8"
                      ">>"_qpdf);
    return image;
}

// A simple font whose codes 1 and 2 are replaced by /Differences
static QPDFObjectHandle
make_differences_font(QPDF& pdf)
{
    return pdf.makeIndirectObject("<<"
                                  " /Type /Font"
                                  " /Subtype /Type1"
                                  " /BaseFont /Helvetica"
                                  " /Encoding <<"
                                  "  /Type /Encoding"
                                  "  /BaseEncoding /WinAnsiEncoding"
                                  "  /Differences [ 1 /eacute /germandbls ]"
                                  " >>"
                                  ">>"_qpdf);
}

// A composite font with two-byte codes, as written by most word
// processors, whose text is only known through its /ToUnicode map
static QPDFObjectHandle
make_identity_font(QPDF& pdf)
{
    auto to_unicode = pdf.newStream("/CIDInit /ProcSet findresource begin\n"
                                    "12 dict begin\n"
                                    "begincmap\n"
                                    "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS)"
                                    " /Supplement 0 >> def\n"
                                    "/CMapName /Adobe-Identity-UCS def\n"
                                    "/CMapType 2 def\n"
                                    "1 begincodespacerange\n"
                                    "<0000> <FFFF>\n"
                                    "endcodespacerange\n"
                                    "3 beginbfchar\n"
                                    "<0003> <0048>\n"
                                    "<0004> <0069>\n"
                                    "<0005> <00E9>\n"
                                    "endbfchar\n"
                                    "endcmap\n"
                                    "CMapName currentdict /CMap defineresource pop\n"
                                    "end\n"
                                    "end\n");
    auto descriptor = pdf.makeIndirectObject("<<"
                                             " /Type /FontDescriptor"
                                             " /FontName /Arial"
                                             " /Flags 32"
                                             " /FontBBox [0 -200 1000 900]"
                                             " /ItalicAngle 0"
                                             " /Ascent 900"
                                             " /Descent -200"
                                             " /CapHeight 700"
                                             " /StemV 80"
                                             ">>"_qpdf);
    auto cid_font = pdf.makeIndirectObject("<<"
                                           " /Type /Font"
                                           " /Subtype /CIDFontType2"
                                           " /BaseFont /Arial"
                                           " /CIDSystemInfo <<"
                                           "  /Registry (Adobe)"
                                           "  /Ordering (Identity)"
                                           "  /Supplement 0"
                                           " >>"
                                           " /DW 600"
                                           " /CIDToGIDMap /Identity"
                                           ">>"_qpdf);
    cid_font.replaceKey("/FontDescriptor", descriptor);
    auto font = pdf.makeIndirectObject("<<"
                                       " /Type /Font"
                                       " /Subtype /Type0"
                                       " /BaseFont /Arial"
                                       " /Encoding /Identity-H"
                                       ">>"_qpdf);
    font.replaceKey("/DescendantFonts", QPDFObjectHandle::newArray({cid_font}));
    font.replaceKey("/ToUnicode", to_unicode);
    return font;
}

// Write pdf to filename and read back the text of every page.
static std::vector<std::string>
read_pages(QPDF& pdf, std::string const& filename)
{
    test_pdf_write(pdf, filename);
    PDFSlicePageText reader(filename);
    std::vector<std::string> result;
    for (int i = 0; i < reader.getPageCount(); ++i) {
        result.push_back(reader.extract(i));
        std::cout << filename << " page " << i + 1 << ": [" << result.back() << "]"
                  << std::endl;
    }
    return result;
}

// Words of text in order, ignoring how they are spaced
static std::vector<std::string>
words(std::string const& text)
{
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        result.push_back(word);
    }
    return result;
}

static void
test_layout()
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);
    test_pdf_add_page(pdf, font, "BT /F1 24 Tf 72 720 Td (Hello World) Tj ET");
    test_pdf_add_page(
        pdf,
        font,
        "BT /F1 12 Tf 14 TL 72 720 Td (First line) Tj 0 -14 Td (Second line) Tj"
        " T* (Third line) Tj ET");
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td [(Hel) (lo) -1000 (World)] TJ ET");
    test_pdf_add_page(
        pdf, font, "BT /F1 12 Tf 72 720 Td (One) Tj ET BT /F1 12 Tf 72 700 Td (Two) Tj ET");
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td (Left) Tj 100 0 Td (Right) Tj ET");
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td (Trailing   ) Tj ET");
    auto pages = read_pages(pdf, "page-text-layout.pdf");
    assert(pages.size() == 6);
    assert(pages.at(0) == "Hello World");
    assert(pages.at(1) == "First line\nSecond line\nThird line");
    assert(words(pages.at(2)) == std::vector<std::string>({"Hello", "World"}));
    assert(words(pages.at(3)) == std::vector<std::string>({"One", "Two"}));
    assert(pages.at(3).find('\n') != std::string::npos);
    assert(words(pages.at(4)) == std::vector<std::string>({"Left", "Right"}));
    assert(pages.at(4).find('\n') == std::string::npos);
    assert(pages.at(5) == "Trailing");
}

static void
test_encodings()
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);
    // WinAnsiEncoding punctuation that PDFDocEncoding maps elsewhere
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td (it\\222s) Tj ET");
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td (\\223quoted\\224) Tj ET");
    test_pdf_add_page(pdf, font, "BT /F1 12 Tf 72 720 Td (caf\\351) Tj ET");
    test_pdf_add_page(
        pdf, make_differences_font(pdf), "BT /F1 12 Tf 72 720 Td (caf\\001 Stra\\002e) Tj ET");
    test_pdf_add_page(
        pdf, make_identity_font(pdf), "BT /F1 12 Tf 72 720 Td <000300040005> Tj ET");
    auto pages = read_pages(pdf, "page-text-encodings.pdf");
    assert(pages.size() == 5);
    assert(pages.at(0) == "it\xe2\x80\x99s");
    assert(pages.at(1) == "\xe2\x80\x9cquoted\xe2\x80\x9d");
    assert(pages.at(2) == "caf\xc3\xa9");
    assert(pages.at(3) == "caf\xc3\xa9 Stra\xc3\x9f" "e");
    assert(pages.at(4) == "Hi\xc3\xa9");
}

static void
test_no_text()
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);
    auto xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Im1", make_image(pdf));
    test_pdf_add_page(pdf, font, "q 100 0 0 100 72 600 cm /Im1 Do Q", xobjects);
    test_pdf_add_page(pdf, font, "");
    test_pdf_add_page(pdf, font, "q /Missing Do Q");
    auto pages = read_pages(pdf, "page-text-empty.pdf");
    assert(pages.size() == 3);
    assert(pages.at(0).empty());
    assert(pages.at(1).empty());
    assert(pages.at(2).empty());
}

static void
test_forms()
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = test_pdf_font(pdf);

    auto inner = make_form(pdf, font, "BT /F1 12 Tf 0 0 Td (Inner form) Tj ET");
    auto outer = make_form(
        pdf, font, "BT /F1 12 Tf 0 0 Td (Outer form) Tj ET q 1 0 0 1 0 -20 cm /Fx2 Do Q");
    auto outer_xobjects = QPDFObjectHandle::newDictionary();
    outer_xobjects.replaceKey("/Fx2", inner);
    outer.getDict().getKey("/Resources").replaceKey("/XObject", outer_xobjects);
    auto xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Fx1", outer);
    test_pdf_add_page(
        pdf,
        font,
        "BT /F1 12 Tf 72 720 Td (Before) Tj ET q 1 0 0 1 72 600 cm /Fx1 Do Q",
        xobjects);
    auto pages = read_pages(pdf, "page-text-forms.pdf");
    assert(
        words(pages.at(0)) ==
        std::vector<std::string>({"Before", "Outer", "form", "Inner", "form"}));
}

static void
test_errors()
{
    try {
        PDFSlicePageText reader("page-text-missing.pdf");
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "missing: " << e.what() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_codec);
        assert(e.getFilename() == "page-text-missing.pdf");
    }

    FILE* f = QUtil::safe_fopen("page-text-garbage.pdf", "wb");
    fputs("this is not a PDF file\n", f);
    fclose(f);
    try {
        PDFSlicePageText reader("page-text-garbage.pdf");
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "garbage: " << e.what() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_codec);
    }

    test_pdf_create("page-text-one.pdf", {"Only page"});
    PDFSlicePageText reader("page-text-one.pdf");
    assert(reader.getPageCount() == 1);
    assert(reader.extract(0) == "Only page");
    for (int index: {-1, 1}) {
        try {
            reader.extract(index);
            assert(false);
        } catch (std::logic_error& e) {
            std::cout << "logic error: " << e.what() << std::endl;
        }
    }
}

static void
test_tidy()
{
    assert(util::tidy_text("") == "");
    assert(util::tidy_text("\n \n") == "");
    assert(util::tidy_text("\n\nA  \r\nB\t\n\f") == "A\nB");
    assert(util::tidy_text("A\n\n  B") == "A\n\n  B");
    assert(util::is_blank(""));
    assert(util::is_blank(" \t\r\n"));
    assert(!util::is_blank(" x "));
}

int
main()
{
    test_layout();
    test_encodings();
    test_no_text();
    test_forms();
    test_errors();
    test_tidy();
    std::cout << "done" << std::endl;
    return 0;
}
