#include <pdfslice/PDFSlicePageText.hh>

#include <pdfslice/PDFSliceExc.hh>
#include <pdfslice/Util.hh>

#include <poppler-document.h>
#include <poppler-page.h>

#include <stdexcept>

using namespace pdfslice;

PDFSlicePageText::PDFSlicePageText(std::string const& filename) :
    filename(filename),
    doc(poppler::document::load_from_file(filename))
{
    if (!this->doc) {
        throw PDFSliceExc(pdfslice_e_codec, filename, 0, "unable to read page text");
    }
    if (this->doc->is_locked()) {
        throw PDFSliceExc(
            pdfslice_e_codec, filename, 0, "encrypted documents are not supported");
    }
}

PDFSlicePageText::~PDFSlicePageText() = default;

int
PDFSlicePageText::getPageCount() const
{
    return this->doc->pages();
}

std::string
PDFSlicePageText::extract(int index)
{
    if ((index < 0) || (index >= getPageCount())) {
        throw std::logic_error(
            "PDFSlicePageText::extract: page index " + std::to_string(index) + " out of range");
    }
    std::unique_ptr<poppler::page> page(this->doc->create_page(index));
    if (!page) {
        throw std::runtime_error(
            this->filename + ": unable to read page " + std::to_string(index + 1));
    }
    auto utf8 = page->text(poppler::rectf(), poppler::page::raw_order_layout).to_utf8();
    return util::tidy_text(std::string(utf8.begin(), utf8.end()));
}
