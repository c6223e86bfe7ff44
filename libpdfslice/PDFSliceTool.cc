#include <pdfslice/PDFSliceTool.hh>

#include <pdfslice/PDFSliceDocument.hh>
#include <pdfslice/PDFSliceExtractor.hh>
#include <pdfslice/PDFSliceRange.hh>
#include <pdfslice/PDFSliceWriter.hh>

#include <memory>
#include <stdexcept>

PDFSliceTool::Members::Members() :
    log(QPDFLogger::defaultLogger())
{
}

PDFSliceTool::PDFSliceTool() :
    m(new Members())
{
}

std::string const&
PDFSliceTool::toolName()
{
    static std::string const name = "open_and_split_pdf";
    return name;
}

std::string const&
PDFSliceTool::toolDescription()
{
    static std::string const description =
        "Open and split a PDF file by page range (start_page, end_page).";
    return description;
}

std::shared_ptr<PDFSliceTool::Config>
PDFSliceTool::config()
{
    return std::shared_ptr<Config>(new Config(*this));
}

std::shared_ptr<QPDFLogger>
PDFSliceTool::getLogger()
{
    return m->log;
}

void
PDFSliceTool::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

void
PDFSliceTool::setOutputStreams(std::ostream* out, std::ostream* err)
{
    setLogger(QPDFLogger::create());
    m->log->setOutputStreams(out, err);
}

void
PDFSliceTool::doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn)
{
    if (m->verbose) {
        fn(*m->log->getInfo(), m->message_prefix);
    }
}

PDFSliceTool::stage_e
PDFSliceTool::getStage() const
{
    return m->stage;
}

PDFSliceTool::stage_e
PDFSliceTool::getFailedStage() const
{
    return m->failed_stage;
}

char const*
PDFSliceTool::stageName(stage_e stage)
{
    switch (stage) {
    case st_idle:
        return "idle";
    case st_validating:
        return "validating";
    case st_opening:
        return "opening";
    case st_resolving:
        return "resolving";
    case st_aggregating:
        return "aggregating";
    case st_writing:
        return "writing";
    case st_done:
        return "done";
    case st_failed:
        return "failed";
    }
    return "unknown";
}

void
PDFSliceTool::setStage(stage_e stage)
{
    m->stage = stage;
    doIfVerbose([&](Pipeline& v, std::string const& prefix) {
        v << prefix << ": " << stageName(stage) << "\n";
    });
}

std::string
PDFSliceTool::fail(std::string const& message)
{
    m->failed_stage = m->stage;
    m->stage = st_failed;
    m->log->error(m->message_prefix + ": " + message + "\n");
    return message;
}

std::string
PDFSliceTool::describe(PDFSliceExc const& e, std::string const& file_path)
{
    switch (e.getErrorCode()) {
    case pdfslice_e_validation:
        return "Error: Invalid input parameters - " + e.getMessageDetail();
    case pdfslice_e_not_found:
        return "Error: File '" + file_path + "' does not exist";
    case pdfslice_e_write:
        return "Error writing PDF '" + e.getFilename() + "': " + e.getMessageDetail();
    default:
        break;
    }
    std::string detail = e.getMessageDetail();
    if (e.getPage() > 0) {
        detail = "page " + std::to_string(e.getPage()) + ": " + detail;
    }
    return "Error reading PDF '" + file_path + "': " + detail;
}

std::string
PDFSliceTool::run(PDFSliceArgs const& args)
{
    m->failed_stage = st_idle;
    setStage(st_validating);
    return handle(PDFSliceValidation::validate(args));
}

std::string
PDFSliceTool::runJSON(JSON const& arguments)
{
    m->failed_stage = st_idle;
    setStage(st_validating);
    return handle(validateJSON(arguments));
}

std::string
PDFSliceTool::handle(PDFSliceValidation const& validation)
{
    if (!validation.ok()) {
        return fail("Error: Invalid input parameters - " + validation.getReason());
    }
    auto const& request = validation.getRequest();
    auto const& path = request.getFilePath();
    m->log->info(
        m->message_prefix + ": splitting PDF '" + path + "' from page " +
        std::to_string(request.getStartPage()) + " to " + std::to_string(request.getEndPage()) +
        "\n");

    try {
        setStage(st_opening);
        PDFSliceDocument document(path, m->log);

        setStage(st_resolving);
        auto range = PDFSliceRange::resolve(request, document.getPageCount(), path);

        // The output document is declared after the input document so
        // it is destroyed first; its pages refer to the input.
        std::unique_ptr<PDFSliceWriter> output;
        if (request.getSaveOutput()) {
            output = std::make_unique<PDFSliceWriter>(PDFSliceWriter::outputFilename(
                path, request.getStartPage(), request.getEndPage()));
            output->setDeterministicID(m->deterministic_id);
        }

        setStage(st_aggregating);
        auto result = PDFSliceExtractor(document).extract(range, output.get());

        if (output) {
            setStage(st_writing);
            output->write();
            result.setOutputFilename(output->getFilename());
            m->log->info(m->message_prefix + ": created new PDF: " + output->getFilename() + "\n");
        }

        setStage(st_done);
        return result.unparse();
    } catch (PDFSliceExc& e) {
        return fail(describe(e, path));
    } catch (std::exception& e) {
        return fail("Error reading PDF '" + path + "': " + e.what());
    }
}
