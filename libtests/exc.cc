#include <pdfslice/assert_test.h>

#include <pdfslice/PDFSliceExc.hh>

#include <iostream>
#include <string>

int
main()
{
    PDFSliceExc e1(pdfslice_e_codec, "report.pdf", 3, "bad content");
    std::cout << e1.what() << std::endl;
    assert(std::string(e1.what()) == "report.pdf (page 3): bad content");
    assert(e1.getErrorCode() == pdfslice_e_codec);
    assert(e1.getFilename() == "report.pdf");
    assert(e1.getPage() == 3);
    assert(e1.getMessageDetail() == "bad content");

    PDFSliceExc e2(pdfslice_e_not_found, "missing.pdf", 0, "file does not exist");
    assert(std::string(e2.what()) == "missing.pdf: file does not exist");

    PDFSliceExc e3(pdfslice_e_codec, "", 2, "no file");
    assert(std::string(e3.what()) == "page 2: no file");

    PDFSliceExc e4(pdfslice_e_write, "", 0, "just a message");
    assert(std::string(e4.what()) == "just a message");

    PDFSliceRangeExc r("report.pdf", 10, 5);
    std::cout << r.what() << std::endl;
    assert(r.getErrorCode() == pdfslice_e_range);
    assert(r.getRequested() == 10);
    assert(r.getAvailable() == 5);
    assert(r.getMessageDetail() == "Requested page 10 exceeds the document length (5 pages).");

    // Range errors are caught as PDFSliceExc.
    try {
        throw PDFSliceRangeExc("", 7, 6);
    } catch (PDFSliceExc& e) {
        assert(e.getErrorCode() == pdfslice_e_range);
        assert(std::string(e.what()).find("7") != std::string::npos);
    }

    std::cout << "done" << std::endl;
    return 0;
}
