#include <pdfslice/assert_test.h>

#include <pdfslice/PDFSliceRequest.hh>

#include <iostream>
#include <stdexcept>

static PDFSliceArgs
make_args(std::string const& path, int start, int end, bool save = false)
{
    PDFSliceArgs args;
    args.file_path = path;
    args.start_page = start;
    args.end_page = end;
    args.save_output = save;
    return args;
}

static void
check_failure(PDFSliceArgs const& args, std::string const& reason)
{
    auto v = PDFSliceValidation::validate(args);
    assert(!v.ok());
    std::cout << "'" << args.file_path << "' " << args.start_page << "-" << args.end_page << ": "
              << v.getReason() << std::endl;
    assert(v.getReason() == reason);
}

static void
test_defaults()
{
    PDFSliceArgs args;
    assert(args.start_page == 1);
    assert(args.end_page == 1);
    assert(!args.save_output);
    args.file_path = "report.pdf";
    auto v = PDFSliceValidation::validate(args);
    assert(v.ok());
    auto const& r = v.getRequest();
    assert(r.getFilePath() == "report.pdf");
    assert(r.getStartPage() == 1);
    assert(r.getEndPage() == 1);
    assert(!r.getSaveOutput());
}

static void
test_valid()
{
    auto v = PDFSliceValidation::validate(make_args("  dir/report.pdf ", 2, 3, true));
    assert(v.ok());
    // The path is kept as given.
    assert(v.getRequest().getFilePath() == "  dir/report.pdf ");
    assert(v.getRequest().getStartPage() == 2);
    assert(v.getRequest().getEndPage() == 3);
    assert(v.getRequest().getSaveOutput());
    assert(PDFSliceValidation::validate(make_args("a.pdf", 4, 4)).ok());
}

static void
test_rules()
{
    check_failure(make_args("", 1, 1), "empty path");
    check_failure(make_args("   ", 1, 1), "empty path");
    check_failure(make_args("\t\n", 1, 1), "empty path");
    check_failure(make_args("a.pdf", 0, 1), "start_page below 1");
    check_failure(make_args("a.pdf", -3, 1), "start_page below 1");
    check_failure(make_args("a.pdf", 1, 0), "end_page below 1");
    check_failure(make_args("a.pdf", 3, 2), "end_page less than start_page");
}

static void
test_order()
{
    // The first rule that fails wins.
    check_failure(make_args(" ", 0, 0), "empty path");
    check_failure(make_args("a.pdf", 0, 0), "start_page below 1");
    check_failure(make_args("a.pdf", 5, -1), "end_page below 1");
}

static void
test_misuse()
{
    auto bad = PDFSliceValidation::validate(make_args("", 1, 1));
    try {
        bad.getRequest();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << std::endl;
    }
    auto good = PDFSliceValidation::validate(make_args("a.pdf", 1, 1));
    try {
        good.getReason();
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "logic error: " << e.what() << std::endl;
    }
    auto f = PDFSliceValidation::failure("custom");
    assert(!f.ok());
    assert(f.getReason() == "custom");
}

int
main()
{
    test_defaults();
    test_valid();
    test_rules();
    test_order();
    test_misuse();
    std::cout << "done" << std::endl;
    return 0;
}
