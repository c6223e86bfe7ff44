#include <pdfslice/PDFSliceExtractor.hh>

#include <pdfslice/PDFSliceExc.hh>

#include <qpdf/Pl_Discard.hh>

#include <stdexcept>

PDFSliceExtractor::PDFSliceExtractor(PDFSliceDocument& document) :
    document(document)
{
}

PDFSliceResult
PDFSliceExtractor::extract(PDFSliceRange const& range, PDFSliceWriter* output)
{
    PDFSliceResult result;
    for (int i = range.getFirst(); i <= range.getLast(); ++i) {
        int pageno = i + 1;
        try {
            auto& page = this->document.getPage(i);
            // poppler skips content it can't decode, so let qpdf
            // decode the page's content first to report damage.
            Pl_Discard discard;
            page.pipeContents(&discard);
            result.addPage(pageno, this->document.getPageText(i));
            if (output) {
                output->addPage(page);
            }
        } catch (std::exception& e) {
            throw PDFSliceExc(pdfslice_e_codec, this->document.getFilename(), pageno, e.what());
        }
    }
    return result;
}
