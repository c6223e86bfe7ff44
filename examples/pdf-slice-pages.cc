//
// This is a stand-alone example of running the page range extraction
// tool once from the command line instead of through the tool server.
// It prints the same text that a client of the server would receive.
//

#include <pdfslice/PDFSliceTool.hh>

#include <qpdf/QUtil.hh>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static char const* whoami = nullptr;

static void
usage()
{
    std::cerr << "Usage: " << whoami << " infile start-page end-page [--save]" << std::endl
              << "Prints the text of pages start-page through end-page of infile." << std::endl
              << "With --save, also writes those pages to a new file next to infile."
              << std::endl;
    exit(2);
}

int
main(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);

    bool deterministic_id = false;
    if ((argc > 1) && (strcmp(argv[1], "--deterministic-id") == 0)) {
        deterministic_id = true;
        --argc;
        ++argv;
    }

    if (!((argc == 4) || ((argc == 5) && (strcmp(argv[4], "--save") == 0)))) {
        usage();
    }

    PDFSliceArgs args;
    args.file_path = argv[1];
    try {
        args.start_page = QUtil::string_to_int(argv[2]);
        args.end_page = QUtil::string_to_int(argv[3]);
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        usage();
    }
    args.save_output = (argc == 5);

    PDFSliceTool tool;
    tool.setOutputStreams(&std::cerr, &std::cerr);
    tool.config()->messagePrefix(whoami);
    if (deterministic_id) {
        tool.config()->deterministicID();
    }
    std::string result = tool.run(args);
    std::cout << result << std::endl;
    return (tool.getStage() == PDFSliceTool::st_done) ? 0 : 2;
}
