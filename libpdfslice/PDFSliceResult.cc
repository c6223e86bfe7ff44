#include <pdfslice/PDFSliceResult.hh>

void
PDFSliceResult::addPage(int number, std::string const& text)
{
    this->pages.push_back({number, text});
}

std::vector<PDFSliceResult::Page> const&
PDFSliceResult::getPages() const
{
    return this->pages;
}

std::string const&
PDFSliceResult::getOutputFilename() const
{
    return this->output_filename;
}

void
PDFSliceResult::setOutputFilename(std::string const& filename)
{
    this->output_filename = filename;
}

std::string
PDFSliceResult::formatPage(Page const& page)
{
    return "--- Page " + std::to_string(page.number) + " ---\n" + page.text;
}

std::string
PDFSliceResult::unparse() const
{
    std::string result = "Content from new PDF:\n\n";
    bool first = true;
    for (auto const& page: this->pages) {
        if (!first) {
            result += "\n";
        }
        first = false;
        result += formatPage(page);
    }
    return result;
}
