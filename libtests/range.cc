#include <pdfslice/assert_test.h>

#include <pdfslice/PDFSliceExc.hh>
#include <pdfslice/PDFSliceRange.hh>

#include <iostream>

static PDFSliceRequest
make_request(int start, int end)
{
    PDFSliceArgs args;
    args.file_path = "report.pdf";
    args.start_page = start;
    args.end_page = end;
    return PDFSliceValidation::validate(args).getRequest();
}

static void
check_range(int start, int end, int page_count, int first, int last)
{
    auto r = PDFSliceRange::resolve(make_request(start, end), page_count);
    std::cout << start << "-" << end << " of " << page_count << " -> [" << r.getFirst() << ", "
              << r.getLast() << "]" << std::endl;
    assert(r.getFirst() == first);
    assert(r.getLast() == last);
    assert(r.size() == end - start + 1);
}

static void
check_exceeds(int start, int end, int page_count)
{
    try {
        PDFSliceRange::resolve(make_request(start, end), page_count, "report.pdf");
        assert(false);
    } catch (PDFSliceRangeExc& e) {
        std::cout << e.what() << std::endl;
        assert(e.getRequested() == end);
        assert(e.getAvailable() == page_count);
        assert(e.getFilename() == "report.pdf");
        std::string msg = e.getMessageDetail();
        assert(msg.find(std::to_string(end)) != std::string::npos);
        assert(msg.find(std::to_string(page_count)) != std::string::npos);
    }
}

int
main()
{
    check_range(1, 1, 1, 0, 0);
    check_range(2, 3, 5, 1, 2);
    check_range(1, 5, 5, 0, 4);
    check_range(5, 5, 5, 4, 4);

    // Never clamped
    check_exceeds(1, 10, 5);
    check_exceeds(6, 6, 5);
    check_exceeds(1, 1, 0);

    std::cout << "done" << std::endl;
    return 0;
}
