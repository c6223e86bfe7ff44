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

#ifndef PDFSLICEEXC_HH
#define PDFSLICEEXC_HH

#include <pdfslice/Constants.h>
#include <pdfslice/DLL.h>

#include <stdexcept>
#include <string>

// PDFSliceExc is thrown by the extraction pipeline for every failure
// after input validation. The error code identifies which stage
// failed. page is the 1-based page number involved in the error, or 0
// if the error is not specific to a page.
class PDFSLICE_DLL_CLASS PDFSliceExc: public std::runtime_error
{
  public:
    PDFSLICE_DLL
    PDFSliceExc(
        pdfslice_error_code_e error_code,
        std::string const& filename,
        int page,
        std::string const& message);
    PDFSLICE_DLL
    ~PDFSliceExc() noexcept override = default;

    // To get a complete error string, call what(), provided by
    // std::exception. The accessors below return the original values
    // used to create the exception.
    PDFSLICE_DLL
    pdfslice_error_code_e getErrorCode() const;
    PDFSLICE_DLL
    std::string const& getFilename() const;
    PDFSLICE_DLL
    int getPage() const;
    PDFSLICE_DLL
    std::string const& getMessageDetail() const;

  private:
    static std::string
    createWhat(std::string const& filename, int page, std::string const& message);

    pdfslice_error_code_e error_code;
    std::string filename;
    int page;
    std::string message;
};

// Thrown when the requested range does not fit in the document.
class PDFSLICE_DLL_CLASS PDFSliceRangeExc: public PDFSliceExc
{
  public:
    PDFSLICE_DLL
    PDFSliceRangeExc(std::string const& filename, int requested, int available);
    PDFSLICE_DLL
    ~PDFSliceRangeExc() noexcept override = default;

    PDFSLICE_DLL
    int getRequested() const;
    PDFSLICE_DLL
    int getAvailable() const;

  private:
    int requested;
    int available;
};

#endif // PDFSLICEEXC_HH
