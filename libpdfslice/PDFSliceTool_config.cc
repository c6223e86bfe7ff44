#include <pdfslice/PDFSliceTool.hh>

PDFSliceTool::Config*
PDFSliceTool::Config::verbose()
{
    o.m->verbose = true;
    return this;
}

PDFSliceTool::Config*
PDFSliceTool::Config::deterministicID()
{
    o.m->deterministic_id = true;
    return this;
}

PDFSliceTool::Config*
PDFSliceTool::Config::messagePrefix(std::string const& prefix)
{
    o.m->message_prefix = prefix;
    return this;
}
