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

#ifndef PDFSLICEREQUEST_HH
#define PDFSLICEREQUEST_HH

#include <pdfslice/DLL.h>

#include <string>

// Arguments exactly as supplied by the caller. Members that the
// caller leaves out keep their defaults, which extract the first page
// without saving anything.
struct PDFSliceArgs
{
    std::string file_path;
    int start_page{1};
    int end_page{1};
    bool save_output{false};
};

// A request that has passed validation: file_path is not blank and
// 1 <= start_page <= end_page. Instances can only be obtained from
// PDFSliceValidation.
class PDFSliceRequest
{
    friend class PDFSliceValidation;

  public:
    std::string const&
    getFilePath() const
    {
        return file_path;
    }
    int
    getStartPage() const
    {
        return start_page;
    }
    int
    getEndPage() const
    {
        return end_page;
    }
    bool
    getSaveOutput() const
    {
        return save_output;
    }

  private:
    PDFSliceRequest(
        std::string const& file_path, int start_page, int end_page, bool save_output) :
        file_path(file_path),
        start_page(start_page),
        end_page(end_page),
        save_output(save_output)
    {
    }

    std::string file_path;
    int start_page;
    int end_page;
    bool save_output;
};

// Result of validating PDFSliceArgs: either a request or the reason
// the arguments were rejected. Validation never performs I/O.
class PDFSliceValidation
{
  public:
    // Rules are applied in this order, and the first one that fails
    // determines the reason:
    //   file_path blank          -> "empty path"
    //   start_page < 1           -> "start_page below 1"
    //   end_page < 1             -> "end_page below 1"
    //   end_page < start_page    -> "end_page less than start_page"
    PDFSLICE_DLL
    static PDFSliceValidation validate(PDFSliceArgs const&);

    PDFSLICE_DLL
    static PDFSliceValidation failure(std::string const& reason);

    PDFSLICE_DLL
    bool ok() const;

    // These throw std::logic_error if called on the wrong kind of
    // result.
    PDFSLICE_DLL
    PDFSliceRequest const& getRequest() const;
    PDFSLICE_DLL
    std::string const& getReason() const;

  private:
    PDFSliceValidation(bool ok, PDFSliceRequest const& request, std::string const& reason);

    bool is_ok;
    PDFSliceRequest request;
    std::string reason;
};

#endif // PDFSLICEREQUEST_HH
