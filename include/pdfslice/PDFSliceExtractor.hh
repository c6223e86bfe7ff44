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

#ifndef PDFSLICEEXTRACTOR_HH
#define PDFSLICEEXTRACTOR_HH

#include <pdfslice/DLL.h>
#include <pdfslice/PDFSliceDocument.hh>
#include <pdfslice/PDFSliceRange.hh>
#include <pdfslice/PDFSliceResult.hh>
#include <pdfslice/PDFSliceWriter.hh>

class PDFSliceExtractor
{
  public:
    PDFSLICE_DLL
    PDFSliceExtractor(PDFSliceDocument& document);

    // Read the text of every page in range in ascending order. If
    // output is not null, also append each page to it. Any failure
    // aborts the whole extraction with a PDFSliceExc of type
    // pdfslice_e_codec naming the page; no partial result is
    // returned.
    PDFSLICE_DLL
    PDFSliceResult extract(PDFSliceRange const& range, PDFSliceWriter* output = nullptr);

  private:
    PDFSliceDocument& document;
};

#endif // PDFSLICEEXTRACTOR_HH
