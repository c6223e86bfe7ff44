#include <pdfslice/PDFSliceWriter.hh>

#include <pdfslice/PDFSliceExc.hh>

#include <qpdf/QIntC.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <stdexcept>

static bool
is_separator(char ch)
{
#ifdef _WIN32
    return (ch == '/') || (ch == '\\');
#else
    return ch == '/';
#endif
}

std::string
PDFSliceWriter::outputFilename(std::string const& infile, int start_page, int end_page)
{
    // Split infile into directory (with its trailing separator), stem,
    // and suffix. The suffix starts at the last dot of the last path
    // element unless that dot is the element's first character.
    size_t name_start = 0;
    for (size_t i = infile.length(); i > 0; --i) {
        if (is_separator(infile.at(i - 1))) {
            name_start = i;
            break;
        }
    }
    std::string dir = infile.substr(0, name_start);
    std::string name = infile.substr(name_start);
    std::string stem = name;
    std::string suffix;
    auto dot = name.rfind('.');
    if ((dot != std::string::npos) && (dot > 0)) {
        stem = name.substr(0, dot);
        suffix = name.substr(dot);
    }
    return dir + stem + "_pgs_" + std::to_string(start_page) + "-" + std::to_string(end_page) +
        suffix;
}

PDFSliceWriter::PDFSliceWriter(std::string const& filename) :
    filename(filename)
{
    this->qpdf.emptyPDF();
}

std::string const&
PDFSliceWriter::getFilename() const
{
    return this->filename;
}

void
PDFSliceWriter::addPage(QPDFPageObjectHelper page)
{
    QPDFPageDocumentHelper(this->qpdf).addPage(page, false);
}

int
PDFSliceWriter::getPageCount()
{
    return QIntC::to_int(QPDFPageDocumentHelper(this->qpdf).getAllPages().size());
}

void
PDFSliceWriter::setDeterministicID(bool val)
{
    this->deterministic_id = val;
}

void
PDFSliceWriter::write()
{
    try {
        QPDFWriter w(this->qpdf, this->filename.c_str());
        w.setDeterministicID(this->deterministic_id);
        w.write();
    } catch (std::exception& e) {
        throw PDFSliceExc(pdfslice_e_write, this->filename, 0, e.what());
    }
}
