#include <pdfslice/assert_test.h>

#include "test_pdf.hh"

#include <pdfslice/PDFSliceTool.hh>

#include <qpdf/JSON.hh>
#include <qpdf/QUtil.hh>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>

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

static bool
starts_with(std::string const& s, std::string const& prefix)
{
    return s.compare(0, prefix.length(), prefix) == 0;
}

static bool
contains(std::string const& s, std::string const& part)
{
    return s.find(part) != std::string::npos;
}

static size_t
count(std::string const& s, std::string const& part)
{
    size_t n = 0;
    for (auto pos = s.find(part); pos != std::string::npos; pos = s.find(part, pos + 1)) {
        ++n;
    }
    return n;
}

static std::string
read_file(std::string const& filename)
{
    std::ifstream in(filename, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

static void
quiet(PDFSliceTool& tool)
{
    auto log = QPDFLogger::create();
    log->setInfo(log->discard());
    log->setError(log->discard());
    tool.setLogger(log);
}

static void
test_extract_range()
{
    PDFSliceTool tool;
    quiet(tool);
    remove("report_pgs_2-3.pdf");
    auto result = tool.run(make_args("report.pdf", 2, 3));
    std::cout << result << std::endl;
    assert(
        result ==
        "Content from new PDF:\n\n"
        "--- Page 2 ---\nThis is page 2\n"
        "--- Page 3 ---\nThis is page 3");
    assert(count(result, "--- Page ") == 2);
    assert(tool.getStage() == PDFSliceTool::st_done);
    assert(tool.getFailedStage() == PDFSliceTool::st_idle);
    assert(!test_file_exists("report_pgs_2-3.pdf"));

    // Default arguments extract the first page.
    PDFSliceArgs args;
    args.file_path = "report.pdf";
    result = tool.run(args);
    assert(result == "Content from new PDF:\n\n--- Page 1 ---\nThis is page 1");

    // Every page, in order
    result = tool.run(make_args("report.pdf", 1, 5));
    assert(count(result, "--- Page ") == 5);
    size_t last = 0;
    for (int i = 1; i <= 5; ++i) {
        auto pos = result.find("--- Page " + std::to_string(i) + " ---");
        assert(pos != std::string::npos);
        assert(pos >= last);
        last = pos;
    }
}

static void
test_font_encoding()
{
    PDFSliceTool tool;
    quiet(tool);
    // \222 is a right single quote in WinAnsiEncoding.
    test_pdf_create("quotes.pdf", {"it\\222s fine"});
    auto result = tool.run(make_args("quotes.pdf", 1, 1));
    std::cout << result << std::endl;
    assert(result == "Content from new PDF:\n\n--- Page 1 ---\nit\xe2\x80\x99s fine");
}

static void
test_idempotent()
{
    PDFSliceTool tool;
    quiet(tool);
    auto r1 = tool.run(make_args("report.pdf", 1, 4));
    auto r2 = tool.run(make_args("report.pdf", 1, 4));
    assert(r1 == r2);
    // A failed call doesn't affect the next one.
    tool.run(make_args("report.pdf", 1, 40));
    assert(tool.getStage() == PDFSliceTool::st_failed);
    auto r3 = tool.run(make_args("report.pdf", 1, 4));
    assert(r1 == r3);
    assert(tool.getStage() == PDFSliceTool::st_done);
    assert(tool.getFailedStage() == PDFSliceTool::st_idle);
}

static void
test_errors()
{
    PDFSliceTool tool;
    quiet(tool);

    auto result = tool.run(make_args("report.pdf", 1, 10));
    std::cout << result << std::endl;
    assert(starts_with(result, "Error"));
    assert(contains(result, "10"));
    assert(contains(result, "5"));
    assert(
        result ==
        "Error reading PDF 'report.pdf': Requested page 10 exceeds the document length (5 "
        "pages).");
    assert(tool.getStage() == PDFSliceTool::st_failed);
    assert(tool.getFailedStage() == PDFSliceTool::st_resolving);

    result = tool.run(make_args("   ", 1, 1));
    std::cout << result << std::endl;
    assert(result == "Error: Invalid input parameters - empty path");
    assert(tool.getFailedStage() == PDFSliceTool::st_validating);

    // Validation happens before looking at the file.
    result = tool.run(make_args("no-such-file.pdf", 3, 2));
    std::cout << result << std::endl;
    assert(result == "Error: Invalid input parameters - end_page less than start_page");
    assert(tool.getFailedStage() == PDFSliceTool::st_validating);

    result = tool.run(make_args("no-such-file.pdf", 0, 2));
    assert(result == "Error: Invalid input parameters - start_page below 1");

    result = tool.run(make_args("no-such-file.pdf", 1, 2));
    std::cout << result << std::endl;
    assert(result == "Error: File 'no-such-file.pdf' does not exist");
    assert(tool.getFailedStage() == PDFSliceTool::st_opening);

    FILE* f = QUtil::safe_fopen("garbage.pdf", "wb");
    fputs("%PDF-1.7\nnothing useful here\n", f);
    fclose(f);
    result = tool.run(make_args("garbage.pdf", 1, 1));
    std::cout << result << std::endl;
    assert(starts_with(result, "Error reading PDF 'garbage.pdf': "));
    assert(tool.getFailedStage() == PDFSliceTool::st_opening);

    test_pdf_create_damaged("damaged.pdf", 3, 2);
    remove("damaged_pgs_1-3.pdf");
    result = tool.run(make_args("damaged.pdf", 1, 3, true));
    std::cout << result << std::endl;
    assert(starts_with(result, "Error reading PDF 'damaged.pdf': page 2: "));
    assert(tool.getFailedStage() == PDFSliceTool::st_aggregating);
    assert(!test_file_exists("damaged_pgs_1-3.pdf"));
}

static void
test_encrypted()
{
    PDFSliceTool tool;
    quiet(tool);

    test_pdf_create_encrypted("encrypted-open.pdf", "");
    auto result = tool.run(make_args("encrypted-open.pdf", 1, 1));
    std::cout << result << std::endl;
    assert(result == "Error reading PDF 'encrypted-open.pdf': encrypted documents are not supported");
    assert(tool.getFailedStage() == PDFSliceTool::st_opening);

    test_pdf_create_encrypted("encrypted-password.pdf", "user");
    result = tool.run(make_args("encrypted-password.pdf", 1, 1));
    std::cout << result << std::endl;
    assert(starts_with(result, "Error reading PDF 'encrypted-password.pdf': "));
    assert(tool.getFailedStage() == PDFSliceTool::st_opening);
}

static void
test_save()
{
    PDFSliceTool tool;
    quiet(tool);
    tool.config()->deterministicID();

    remove("report_pgs_2-4.pdf");
    auto result = tool.run(make_args("report.pdf", 2, 4, true));
    assert(starts_with(result, "Content from new PDF:\n\n--- Page 2 ---\n"));
    assert(count(result, "--- Page ") == 3);
    assert(test_file_exists("report_pgs_2-4.pdf"));
    assert(test_pdf_count_pages("report_pgs_2-4.pdf") == 3);

    // The saved file can itself be split, and holds the right pages.
    result = tool.run(make_args("report_pgs_2-4.pdf", 1, 3));
    assert(contains(result, "--- Page 1 ---\nThis is page 2"));
    assert(contains(result, "--- Page 3 ---\nThis is page 4"));

    // Saving again silently replaces the file with identical output.
    auto first = read_file("report_pgs_2-4.pdf");
    result = tool.run(make_args("report.pdf", 2, 4, true));
    assert(tool.getStage() == PDFSliceTool::st_done);
    assert(read_file("report_pgs_2-4.pdf") == first);

    // Make the output file name a directory so that writing fails.
    if (mkdir("report_pgs_5-5.pdf", 0755) != 0) {
        assert(errno == EEXIST);
    }
    result = tool.run(make_args("report.pdf", 5, 5, true));
    std::cout << result << std::endl;
    assert(starts_with(result, "Error writing PDF 'report_pgs_5-5.pdf': "));
    assert(!contains(result, "This is page 5"));
    assert(tool.getFailedStage() == PDFSliceTool::st_writing);
}

static void
test_logging()
{
    std::ostringstream out;
    std::ostringstream err;
    PDFSliceTool tool;
    tool.setOutputStreams(&out, &err);
    tool.config()->verbose()->messagePrefix("tool-test");

    tool.run(make_args("report.pdf", 1, 2));
    std::cout << out.str();
    assert(contains(out.str(), "tool-test: splitting PDF 'report.pdf' from page 1 to 2"));
    assert(contains(out.str(), "tool-test: opening"));
    assert(contains(out.str(), "tool-test: aggregating"));
    assert(contains(out.str(), "tool-test: done"));
    assert(!contains(out.str(), "tool-test: writing"));
    assert(err.str().empty());

    tool.run(make_args("report.pdf", 2, 1));
    std::cout << err.str();
    assert(contains(
        err.str(),
        "tool-test: Error: Invalid input parameters - end_page less than start_page\n"));

    std::string seen;
    tool.doIfVerbose([&seen](Pipeline&, std::string const& prefix) { seen = prefix; });
    assert(seen == "tool-test");

    PDFSliceTool tool2;
    bool called = false;
    tool2.doIfVerbose([&called](Pipeline&, std::string const&) { called = true; });
    assert(!called);
    assert(tool2.getLogger() == QPDFLogger::defaultLogger());
}

static void
test_json()
{
    PDFSliceTool tool;
    quiet(tool);

    auto result = tool.runJSON(
        JSON::parse(R"({"file_path": "report.pdf", "start_page": 2, "end_page": "3"})"));
    assert(count(result, "--- Page ") == 2);

    result = tool.runJSON(JSON::parse(R"({"file_path": "report.pdf", "start_page": null})"));
    assert(result == "Content from new PDF:\n\n--- Page 1 ---\nThis is page 1");

    result = tool.runJSON(JSON::parse(R"({"file_path": "report.pdf", "color": "blue"})"));
    assert(tool.getStage() == PDFSliceTool::st_done);

    remove("report_pgs_1-1.pdf");
    result = tool.runJSON(JSON::parse(R"({"file_path": "report.pdf", "save_pdf": true})"));
    assert(test_file_exists("report_pgs_1-1.pdf"));
    remove("report_pgs_1-1.pdf");
    result = tool.runJSON(JSON::parse(R"({"file_path": "report.pdf", "save_output": "true"})"));
    assert(test_file_exists("report_pgs_1-1.pdf"));

    struct
    {
        char const* arguments;
        char const* reason;
    } bad[] = {
        {R"([1, 2])", "arguments must be an object"},
        {R"({})", "file_path is required"},
        {R"({"file_path": null})", "file_path is required"},
        {R"({"file_path": 12})", "file_path must be a string"},
        {R"({"file_path": "report.pdf", "start_page": 1.5})", "start_page must be an integer"},
        {R"({"file_path": "report.pdf", "start_page": "two"})", "start_page must be an integer"},
        {R"({"file_path": "report.pdf", "end_page": true})", "end_page must be an integer"},
        {R"({"file_path": "report.pdf", "end_page": 99999999999})", "end_page must be an integer"},
        {R"({"file_path": "report.pdf", "save_output": 1})", "save_output must be a boolean"},
        {R"({"file_path": "report.pdf", "save_pdf": "yes"})", "save_pdf must be a boolean"},
        {R"({"file_path": " ", "start_page": 0})", "empty path"},
        {R"({"file_path": "report.pdf", "start_page": "-1"})", "start_page below 1"},
    };
    for (auto const& b: bad) {
        auto v = PDFSliceTool::validateJSON(JSON::parse(b.arguments));
        assert(!v.ok());
        std::cout << b.arguments << " -> " << v.getReason() << std::endl;
        assert(v.getReason() == b.reason);
        result = tool.runJSON(JSON::parse(b.arguments));
        assert(result == std::string("Error: Invalid input parameters - ") + b.reason);
    }
}

static void
test_names()
{
    assert(PDFSliceTool::toolName() == "open_and_split_pdf");
    assert(!PDFSliceTool::toolDescription().empty());
    assert(PDFSliceTool::inputSchema().isDictionary());
    assert(std::string(PDFSliceTool::stageName(PDFSliceTool::st_resolving)) == "resolving");
    assert(std::string(PDFSliceTool::stageName(PDFSliceTool::st_failed)) == "failed");
}

int
main()
{
    test_pdf_create_numbered("report.pdf", 5);
    test_extract_range();
    test_font_encoding();
    test_idempotent();
    test_errors();
    test_encrypted();
    test_save();
    test_logging();
    test_json();
    test_names();
    std::cout << "done" << std::endl;
    return 0;
}
