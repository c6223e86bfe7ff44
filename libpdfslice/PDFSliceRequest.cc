#include <pdfslice/PDFSliceRequest.hh>

#include <pdfslice/Util.hh>

#include <stdexcept>

using namespace pdfslice;

PDFSliceValidation::PDFSliceValidation(
    bool ok, PDFSliceRequest const& request, std::string const& reason) :
    is_ok(ok),
    request(request),
    reason(reason)
{
}

PDFSliceValidation
PDFSliceValidation::validate(PDFSliceArgs const& args)
{
    if (util::is_blank(args.file_path)) {
        return failure("empty path");
    }
    if (args.start_page < 1) {
        return failure("start_page below 1");
    }
    if (args.end_page < 1) {
        return failure("end_page below 1");
    }
    if (args.end_page < args.start_page) {
        return failure("end_page less than start_page");
    }
    return {
        true,
        PDFSliceRequest(args.file_path, args.start_page, args.end_page, args.save_output),
        ""};
}

PDFSliceValidation
PDFSliceValidation::failure(std::string const& reason)
{
    return {false, PDFSliceRequest("", 0, 0, false), reason};
}

bool
PDFSliceValidation::ok() const
{
    return this->is_ok;
}

PDFSliceRequest const&
PDFSliceValidation::getRequest() const
{
    if (!this->is_ok) {
        throw std::logic_error(
            "PDFSliceValidation::getRequest called on a failed validation: " + this->reason);
    }
    return this->request;
}

std::string const&
PDFSliceValidation::getReason() const
{
    if (this->is_ok) {
        throw std::logic_error("PDFSliceValidation::getReason called on a successful validation");
    }
    return this->reason;
}
