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

#ifndef PDFSLICEDOCUMENT_HH
#define PDFSLICEDOCUMENT_HH

#include <pdfslice/DLL.h>
#include <pdfslice/PDFSlicePageText.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <memory>
#include <string>
#include <vector>

// A PDFSliceDocument is an input PDF opened for the duration of one
// request. qpdf provides its page objects, and poppler reads the text
// of its pages. The underlying file is released when the object is
// destroyed. Pages copied from this document into another QPDF refer
// back to it for stream data, so it must outlive any output document
// that is written from its pages.
class PDFSliceDocument
{
  public:
    // Throws PDFSliceExc with pdfslice_e_not_found if filename does
    // not exist and with pdfslice_e_codec if qpdf can't read it or it
    // is encrypted. If logger is not null, qpdf's warnings go to it.
    PDFSLICE_DLL
    PDFSliceDocument(std::string const& filename, std::shared_ptr<QPDFLogger> logger = nullptr);

    PDFSliceDocument(PDFSliceDocument const&) = delete;
    PDFSliceDocument& operator=(PDFSliceDocument const&) = delete;

    PDFSLICE_DLL
    std::string const& getFilename() const;
    PDFSLICE_DLL
    int getPageCount() const;
    // index is 0-based. Throws std::logic_error if out of range.
    PDFSLICE_DLL
    QPDFPageObjectHelper& getPage(int index);
    // Return the text of the page at index. Throws std::logic_error if
    // index is out of range.
    PDFSLICE_DLL
    std::string getPageText(int index);

  private:
    std::string filename;
    QPDF qpdf;
    std::vector<QPDFPageObjectHelper> pages;
    std::unique_ptr<PDFSlicePageText> text;
};

#endif // PDFSLICEDOCUMENT_HH
