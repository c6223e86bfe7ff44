#include <pdfslice/PDFSliceRange.hh>

#include <pdfslice/PDFSliceExc.hh>

PDFSliceRange::PDFSliceRange(int first, int last) :
    first(first),
    last(last)
{
}

PDFSliceRange
PDFSliceRange::resolve(PDFSliceRequest const& request, int page_count, std::string const& filename)
{
    // The request guarantees 1 <= start_page <= end_page, so checking
    // the end page is enough to keep the start page in range too.
    if (request.getEndPage() > page_count) {
        throw PDFSliceRangeExc(filename, request.getEndPage(), page_count);
    }
    return {request.getStartPage() - 1, request.getEndPage() - 1};
}

int
PDFSliceRange::getFirst() const
{
    return this->first;
}

int
PDFSliceRange::getLast() const
{
    return this->last;
}

int
PDFSliceRange::size() const
{
    return this->last - this->first + 1;
}
