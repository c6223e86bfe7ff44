#include <pdfslice/PDFSliceExc.hh>

PDFSliceExc::PDFSliceExc(
    pdfslice_error_code_e error_code,
    std::string const& filename,
    int page,
    std::string const& message) :
    std::runtime_error(createWhat(filename, page, message)),
    error_code(error_code),
    filename(filename),
    page(page),
    message(message)
{
}

std::string
PDFSliceExc::createWhat(std::string const& filename, int page, std::string const& message)
{
    std::string result;
    if (!filename.empty()) {
        result += filename;
    }
    if (page > 0) {
        if (!filename.empty()) {
            result += " (";
        }
        result += "page " + std::to_string(page);
        if (!filename.empty()) {
            result += ")";
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

pdfslice_error_code_e
PDFSliceExc::getErrorCode() const
{
    return this->error_code;
}

std::string const&
PDFSliceExc::getFilename() const
{
    return this->filename;
}

int
PDFSliceExc::getPage() const
{
    return this->page;
}

std::string const&
PDFSliceExc::getMessageDetail() const
{
    return this->message;
}

PDFSliceRangeExc::PDFSliceRangeExc(std::string const& filename, int requested, int available) :
    PDFSliceExc(
        pdfslice_e_range,
        filename,
        0,
        "Requested page " + std::to_string(requested) + " exceeds the document length (" +
            std::to_string(available) + " pages)."),
    requested(requested),
    available(available)
{
}

int
PDFSliceRangeExc::getRequested() const
{
    return this->requested;
}

int
PDFSliceRangeExc::getAvailable() const
{
    return this->available;
}
