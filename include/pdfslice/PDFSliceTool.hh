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

#ifndef PDFSLICETOOL_HH
#define PDFSLICETOOL_HH

#include <pdfslice/DLL.h>
#include <pdfslice/PDFSliceExc.hh>
#include <pdfslice/PDFSliceRequest.hh>

#include <qpdf/JSON.hh>
#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <iostream>
#include <memory>
#include <string>

// PDFSliceTool is the page range extraction tool offered to clients.
// Each call validates its arguments, opens the input file, resolves
// the page range, reads the text of each page and, if asked, writes
// the pages to a new file next to the input. Calls are independent of
// each other and always return a string: either the extracted text or
// a message starting with "Error". Nothing is thrown to the caller.
class PDFSliceTool
{
  public:
    // Stages of a call, in the order they are entered. A call either
    // ends in st_done or jumps to st_failed from the stage that
    // failed.
    enum stage_e {
        st_idle,
        st_validating,
        st_opening,
        st_resolving,
        st_aggregating,
        st_writing,
        st_done,
        st_failed,
    };

    PDFSLICE_DLL
    PDFSliceTool();

    // Name, description, and JSON schema of the tool's arguments as
    // advertised to clients
    PDFSLICE_DLL
    static std::string const& toolName();
    PDFSLICE_DLL
    static std::string const& toolDescription();
    PDFSLICE_DLL
    static JSON inputSchema();

    class Config
    {
        friend class PDFSliceTool;

      public:
        // Log each stage of every call to the info stream
        PDFSLICE_DLL
        Config* verbose();
        // Write saved pages with deterministic document IDs
        PDFSLICE_DLL
        Config* deterministicID();
        // Prefix for log messages; defaults to "pdfslice"
        PDFSLICE_DLL
        Config* messagePrefix(std::string const&);

      private:
        Config() = delete;
        Config(PDFSliceTool& o) :
            o(o)
        {
        }
        PDFSliceTool& o;
    };
    PDFSLICE_DLL
    std::shared_ptr<Config> config();

    // By default, all output goes to QPDFLogger::defaultLogger(). The
    // same logger is given to qpdf for each document that is opened,
    // so qpdf's warnings go there too.
    PDFSLICE_DLL
    std::shared_ptr<QPDFLogger> getLogger();
    PDFSLICE_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);
    PDFSLICE_DLL
    void setOutputStreams(std::ostream* out, std::ostream* err);

    PDFSLICE_DLL
    void doIfVerbose(std::function<void(Pipeline&, std::string const& prefix)> fn);

    // Run one extraction.
    PDFSLICE_DLL
    std::string run(PDFSliceArgs const&);

    // Run one extraction with arguments given as a JSON object as sent
    // by a client. Arguments of the wrong type are reported like any
    // other invalid argument.
    PDFSLICE_DLL
    std::string runJSON(JSON const& arguments);

    // Convert a JSON object to arguments and validate them. file_path
    // is required. start_page and end_page may be integers or strings
    // containing integers; save_output (or its alias save_pdf) may be
    // a boolean or "true" or "false". Null members are treated as
    // absent, and unknown members are ignored.
    PDFSLICE_DLL
    static PDFSliceValidation validateJSON(JSON const& arguments);

    // Stage reached by the most recent call, and the stage it failed
    // in if it failed
    PDFSLICE_DLL
    stage_e getStage() const;
    PDFSLICE_DLL
    stage_e getFailedStage() const;
    PDFSLICE_DLL
    static char const* stageName(stage_e);

  private:
    std::string handle(PDFSliceValidation const&);
    std::string describe(PDFSliceExc const&, std::string const& file_path);
    std::string fail(std::string const& message);
    void setStage(stage_e);

    class Members
    {
        friend class PDFSliceTool;

      public:
        PDFSLICE_DLL
        ~Members() = default;

      private:
        Members();
        Members(Members const&) = delete;

        std::shared_ptr<QPDFLogger> log;
        std::string message_prefix{"pdfslice"};
        bool verbose{false};
        bool deterministic_id{false};
        stage_e stage{st_idle};
        stage_e failed_stage{st_idle};
    };
    std::shared_ptr<Members> m;
};

#endif // PDFSLICETOOL_HH
