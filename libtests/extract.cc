#include <pdfslice/assert_test.h>

#include "test_pdf.hh"

#include <pdfslice/PDFSliceDocument.hh>
#include <pdfslice/PDFSliceExc.hh>
#include <pdfslice/PDFSliceExtractor.hh>
#include <pdfslice/PDFSliceRange.hh>
#include <pdfslice/PDFSliceWriter.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <cstdio>
#include <iostream>
#include <stdexcept>

static PDFSliceRequest
make_request(std::string const& path, int start, int end)
{
    PDFSliceArgs args;
    args.file_path = path;
    args.start_page = start;
    args.end_page = end;
    return PDFSliceValidation::validate(args).getRequest();
}

static void
test_open()
{
    test_pdf_create_numbered("extract-five.pdf", 5);
    PDFSliceDocument doc("extract-five.pdf");
    assert(doc.getFilename() == "extract-five.pdf");
    assert(doc.getPageCount() == 5);
    try {
        doc.getPage(5);
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << std::endl;
    }
}

static void
test_open_errors()
{
    try {
        PDFSliceDocument doc("extract-missing.pdf");
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "missing: " << e.what() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_not_found);
        assert(e.getFilename() == "extract-missing.pdf");
    }

    FILE* f = QUtil::safe_fopen("extract-garbage.pdf", "wb");
    fputs("this is not a PDF file\n", f);
    fclose(f);
    // Capture qpdf's warnings so they can be checked.
    std::string warnings;
    auto log = QPDFLogger::create();
    log->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    try {
        PDFSliceDocument doc("extract-garbage.pdf", log);
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "garbage: " << e.getErrorCode() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_codec);
        assert(e.getFilename() == "extract-garbage.pdf");
        assert(!e.getMessageDetail().empty());
    }
    assert(!warnings.empty());

    try {
        PDFSliceDocument doc(".");
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "directory: " << e.getErrorCode() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_codec);
    }
}

static void
test_extract()
{
    PDFSliceDocument doc("extract-five.pdf");
    auto range = PDFSliceRange::resolve(make_request("extract-five.pdf", 2, 4), doc.getPageCount());
    auto result = PDFSliceExtractor(doc).extract(range);
    auto const& pages = result.getPages();
    assert(pages.size() == 3);
    for (size_t i = 0; i < pages.size(); ++i) {
        int n = static_cast<int>(i) + 2;
        assert(pages.at(i).number == n);
        assert(pages.at(i).text == "This is page " + std::to_string(n));
        auto formatted = PDFSliceResult::formatPage(pages.at(i));
        assert(formatted.find("--- Page " + std::to_string(n) + " ---\n") == 0);
    }
    assert(result.getOutputFilename().empty());
    std::cout << result.unparse() << std::endl;
    assert(
        result.unparse() ==
        "Content from new PDF:\n\n"
        "--- Page 2 ---\nThis is page 2\n"
        "--- Page 3 ---\nThis is page 3\n"
        "--- Page 4 ---\nThis is page 4");
}

static void
test_extract_and_save()
{
    std::string outfile;
    {
        PDFSliceDocument doc("extract-five.pdf");
        auto range =
            PDFSliceRange::resolve(make_request("extract-five.pdf", 4, 5), doc.getPageCount());
        outfile = PDFSliceWriter::outputFilename("extract-five.pdf", 4, 5);
        assert(outfile == "extract-five_pgs_4-5.pdf");
        remove(outfile.c_str());
        PDFSliceWriter writer(outfile);
        writer.setDeterministicID(true);
        auto result = PDFSliceExtractor(doc).extract(range, &writer);
        assert(result.getPages().size() == 2);
        assert(writer.getPageCount() == 2);
        writer.write();
    }
    assert(test_pdf_count_pages(outfile) == 2);
    // The copied pages are the original pages, not just their text.
    PDFSliceDocument saved(outfile);
    auto range = PDFSliceRange::resolve(make_request(outfile, 1, 2), saved.getPageCount());
    auto result = PDFSliceExtractor(saved).extract(range);
    assert(result.getPages().at(0).text == "This is page 4");
    assert(result.getPages().at(1).text == "This is page 5");
}

static void
test_damaged_page()
{
    test_pdf_create_damaged("extract-damaged.pdf", 3, 2);
    auto log = QPDFLogger::create();
    log->setWarn(log->discard());
    PDFSliceDocument doc("extract-damaged.pdf", log);

    // Pages around the damaged one are fine.
    auto r1 = PDFSliceRange::resolve(make_request("extract-damaged.pdf", 1, 1), 3);
    assert(PDFSliceExtractor(doc).extract(r1).getPages().size() == 1);
    auto r3 = PDFSliceRange::resolve(make_request("extract-damaged.pdf", 3, 3), 3);
    assert(PDFSliceExtractor(doc).extract(r3).getPages().size() == 1);

    auto all = PDFSliceRange::resolve(make_request("extract-damaged.pdf", 1, 3), 3);
    try {
        PDFSliceExtractor(doc).extract(all);
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "damaged: page " << e.getPage() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_codec);
        assert(e.getPage() == 2);
        assert(e.getFilename() == "extract-damaged.pdf");
    }
}

static void
test_output_filename()
{
    struct
    {
        char const* infile;
        int start;
        int end;
        char const* outfile;
    } cases[] = {
        {"report.pdf", 2, 3, "report_pgs_2-3.pdf"},
        {"dir/report.pdf", 1, 10, "dir/report_pgs_1-10.pdf"},
        {"/abs/dir/report.PDF", 5, 5, "/abs/dir/report_pgs_5-5.PDF"},
        {"archive.tar.pdf", 1, 2, "archive.tar_pgs_1-2.pdf"},
        {"noext", 1, 1, "noext_pgs_1-1"},
        {"dir.d/noext", 1, 1, "dir.d/noext_pgs_1-1"},
        {".hidden", 3, 4, ".hidden_pgs_3-4"},
        {"dir/.hidden", 3, 4, "dir/.hidden_pgs_3-4"},
    };
    for (auto const& c: cases) {
        auto out = PDFSliceWriter::outputFilename(c.infile, c.start, c.end);
        std::cout << c.infile << " " << c.start << "-" << c.end << " -> " << out << std::endl;
        assert(out == c.outfile);
    }
}

static void
test_write_error()
{
    PDFSliceWriter writer("extract-no-such-dir/out.pdf");
    try {
        writer.write();
        assert(false);
    } catch (PDFSliceExc& e) {
        std::cout << "write error: " << e.getErrorCode() << std::endl;
        assert(e.getErrorCode() == pdfslice_e_write);
        assert(e.getFilename() == "extract-no-such-dir/out.pdf");
    }
}

int
main()
{
    test_open();
    test_open_errors();
    test_extract();
    test_extract_and_save();
    test_damaged_page();
    test_output_filename();
    test_write_error();
    std::cout << "done" << std::endl;
    return 0;
}
