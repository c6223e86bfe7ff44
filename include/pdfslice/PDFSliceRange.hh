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

#ifndef PDFSLICERANGE_HH
#define PDFSLICERANGE_HH

#include <pdfslice/DLL.h>
#include <pdfslice/PDFSliceRequest.hh>

#include <string>

// A range of pages as 0-based, inclusive indexes into a document.
// A resolved range always satisfies 0 <= first <= last < page count.
class PDFSliceRange
{
  public:
    // Map the request's 1-based page numbers onto a document with
    // page_count pages. The range is never clamped: if the request's
    // end page is past the end of the document, PDFSliceRangeExc is
    // thrown with filename attached.
    PDFSLICE_DLL
    static PDFSliceRange
    resolve(PDFSliceRequest const& request, int page_count, std::string const& filename = "");

    PDFSLICE_DLL
    int getFirst() const;
    PDFSLICE_DLL
    int getLast() const;
    PDFSLICE_DLL
    int size() const;

  private:
    PDFSliceRange(int first, int last);

    int first;
    int last;
};

#endif // PDFSLICERANGE_HH
