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

#ifndef PDFSLICERESULT_HH
#define PDFSLICERESULT_HH

#include <pdfslice/DLL.h>

#include <string>
#include <vector>

// The text extracted from a range of pages, in ascending page order,
// and the name of the file the pages were saved to, if any.
class PDFSliceResult
{
  public:
    struct Page
    {
        int number; // 1-based
        std::string text;
    };

    PDFSLICE_DLL
    void addPage(int number, std::string const& text);
    PDFSLICE_DLL
    std::vector<Page> const& getPages() const;

    // Empty unless the pages were saved
    PDFSLICE_DLL
    std::string const& getOutputFilename() const;
    PDFSLICE_DLL
    void setOutputFilename(std::string const&);

    // "--- Page n ---\n" followed by the page's text
    PDFSLICE_DLL
    static std::string formatPage(Page const&);

    // The text returned to callers of the tool: a heading followed by
    // the formatted pages separated by newlines.
    PDFSLICE_DLL
    std::string unparse() const;

  private:
    std::vector<Page> pages;
    std::string output_filename;
};

#endif // PDFSLICERESULT_HH
