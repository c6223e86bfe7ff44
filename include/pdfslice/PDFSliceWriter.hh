// Copyright (c) 2026 The pdfslice Authors
//
// This file is part of pdfslice.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PDFSLICEWRITER_HH
#define PDFSLICEWRITER_HH

#include <pdfslice/DLL.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <string>

// A new, initially empty PDF that pages are appended to and that is
// then written to a file. Pages added from another document keep
// referring to that document until write() is called, so the source
// document must stay open until then.
class PDFSliceWriter
{
  public:
    // Return the name of the file that pages start_page through
    // end_page of infile are saved to: infile's directory and stem
    // with "_pgs_<start_page>-<end_page>" and infile's suffix
    // appended. For example, pages 2 through 3 of "dir/report.pdf"
    // are saved to "dir/report_pgs_2-3.pdf".
    PDFSLICE_DLL
    static std::string outputFilename(std::string const& infile, int start_page, int end_page);

    PDFSLICE_DLL
    PDFSliceWriter(std::string const& filename);

    PDFSliceWriter(PDFSliceWriter const&) = delete;
    PDFSliceWriter& operator=(PDFSliceWriter const&) = delete;

    PDFSLICE_DLL
    std::string const& getFilename() const;

    // Append a copy of page, including its resources and annotations,
    // to the end of the document.
    PDFSLICE_DLL
    void addPage(QPDFPageObjectHelper page);
    PDFSLICE_DLL
    int getPageCount();

    // Use IDs computed from the file's contents rather than random
    // ones so that the same pages always produce the same file.
    PDFSLICE_DLL
    void setDeterministicID(bool);

    // Write the document, silently replacing any existing file.
    // Throws PDFSliceExc with pdfslice_e_write on failure.
    PDFSLICE_DLL
    void write();

  private:
    std::string filename;
    QPDF qpdf;
    bool deterministic_id{false};
};

#endif // PDFSLICEWRITER_HH
