#include <pdfslice/Constants.h>
#include <pdfslice/DLL.h>
#include <pdfslice/PDFSliceServer.hh>
#include <pdfslice/PDFSliceTool.hh>

#include <qpdf/QPDFLogger.hh>
#include <qpdf/QUtil.hh>

#include <poppler-global.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static char const* whoami = nullptr;

static void
print_usage(std::ostream& os)
{
    os << "Usage: " << whoami << " [options]\n"
       << "Run the " << whoami << " tool server on standard input and output.\n"
       << "Options:\n"
       << "  --verbose           log each stage of every tool call\n"
       << "  --quiet             don't log informational messages\n"
       << "  --deterministic-id  write saved pages with deterministic IDs\n"
       << "  --version           show version and exit\n"
       << "  --help              show this help and exit\n";
}

// poppler reports problems in files it reads through this function.
// closure is the QPDFLogger that receives qpdf's warnings.
static void
poppler_warning(std::string const& msg, void* closure)
{
    static_cast<QPDFLogger*>(closure)->warn(std::string(whoami) + ": poppler: " + msg + "\n");
}

static void
usage(std::string const& msg)
{
    std::cerr << whoami << ": " << msg << "\n";
    print_usage(std::cerr);
    exit(pdfslice_exit_error);
}

int
realmain(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);

    PDFSliceTool tool;
    auto config = tool.config();
    config->messagePrefix(whoami);
    bool quiet = false;
    for (int i = 1; i < argc; ++i) {
        char const* arg = argv[i];
        if (strcmp(arg, "--help") == 0) {
            print_usage(std::cout);
            return pdfslice_exit_success;
        } else if (strcmp(arg, "--version") == 0) {
            std::cout << whoami << " version " << PDFSLICE_VERSION << "\n";
            return pdfslice_exit_success;
        } else if (strcmp(arg, "--verbose") == 0) {
            config->verbose();
        } else if (strcmp(arg, "--quiet") == 0) {
            quiet = true;
        } else if (strcmp(arg, "--deterministic-id") == 0) {
            config->deterministicID();
        } else {
            usage(std::string("unknown option ") + arg);
        }
    }

    // Standard output carries the protocol, so everything else goes to
    // standard error.
    auto log = QPDFLogger::create();
    log->setInfo(quiet ? log->discard() : log->standardError());
    tool.setLogger(log);
    poppler::set_debug_error_function(poppler_warning, log.get());

    PDFSliceServer server(whoami, PDFSLICE_VERSION);
    server.setLogger(log);
    server.registerTool(
        PDFSliceTool::toolName(),
        PDFSliceTool::toolDescription(),
        PDFSliceTool::inputSchema(),
        [&tool](JSON const& arguments) { return tool.runJSON(arguments); });

    log->info(std::string(whoami) + ": server starting\n");
    try {
        server.run(std::cin, std::cout);
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << std::endl;
        return pdfslice_exit_error;
    }
    return pdfslice_exit_success;
}

int
main(int argc, char* argv[])
{
    return realmain(argc, argv);
}
