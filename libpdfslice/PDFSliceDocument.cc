#include <pdfslice/PDFSliceDocument.hh>

#include <pdfslice/PDFSliceExc.hh>

#include <qpdf/QIntC.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

static bool
path_exists(std::string const& path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

PDFSliceDocument::PDFSliceDocument(
    std::string const& filename, std::shared_ptr<QPDFLogger> logger) :
    filename(filename)
{
    // Check existence first so that a missing file is not reported as
    // a confusing parse error.
    if (!path_exists(filename)) {
        throw PDFSliceExc(pdfslice_e_not_found, filename, 0, "file does not exist");
    }
    if (logger) {
        this->qpdf.setLogger(logger);
    }
    try {
        this->qpdf.processFile(filename.c_str());
        if (this->qpdf.isEncrypted()) {
            throw PDFSliceExc(
                pdfslice_e_codec, filename, 0, "encrypted documents are not supported");
        }
        this->pages = QPDFPageDocumentHelper(this->qpdf).getAllPages();
        this->text = std::make_unique<PDFSlicePageText>(filename);
    } catch (PDFSliceExc&) {
        throw;
    } catch (std::exception& e) {
        throw PDFSliceExc(pdfslice_e_codec, filename, 0, e.what());
    }
}

std::string const&
PDFSliceDocument::getFilename() const
{
    return this->filename;
}

int
PDFSliceDocument::getPageCount() const
{
    return QIntC::to_int(this->pages.size());
}

QPDFPageObjectHelper&
PDFSliceDocument::getPage(int index)
{
    if ((index < 0) || (index >= getPageCount())) {
        throw std::logic_error(
            "PDFSliceDocument::getPage: page index " + std::to_string(index) + " out of range");
    }
    return this->pages.at(QIntC::to_size(index));
}

std::string
PDFSliceDocument::getPageText(int index)
{
    if ((index < 0) || (index >= getPageCount())) {
        throw std::logic_error(
            "PDFSliceDocument::getPageText: page index " + std::to_string(index) +
            " out of range");
    }
    return this->text->extract(index);
}
