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

#ifndef PDFSLICEPAGETEXT_HH
#define PDFSLICEPAGETEXT_HH

#include <pdfslice/DLL.h>

#include <memory>
#include <string>

namespace poppler
{
    class document;
}

// PDFSlicePageText reads the text of pages of a PDF file with
// poppler, which decodes strings through each font's encoding,
// /Differences, and /ToUnicode map. Text is returned in content stream
// order as UTF-8 with one line per text line and trailing whitespace
// removed from each line. A page without text, such as a scanned
// image, yields an empty string.
class PDFSlicePageText
{
  public:
    // Throws PDFSliceExc with pdfslice_e_codec if poppler can't load
    // filename or the file needs a password.
    PDFSLICE_DLL
    PDFSlicePageText(std::string const& filename);
    PDFSLICE_DLL
    ~PDFSlicePageText();

    PDFSlicePageText(PDFSlicePageText const&) = delete;
    PDFSlicePageText& operator=(PDFSlicePageText const&) = delete;

    PDFSLICE_DLL
    int getPageCount() const;

    // index is 0-based. Throws std::logic_error if index is out of
    // range and std::runtime_error if poppler can't read the page.
    PDFSLICE_DLL
    std::string extract(int index);

  private:
    std::string filename;
    std::unique_ptr<poppler::document> doc;
};

#endif // PDFSLICEPAGETEXT_HH
