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

#ifndef PDFSLICESERVER_HH
#define PDFSLICESERVER_HH

#include <pdfslice/DLL.h>

#include <qpdf/JSON.hh>
#include <qpdf/QPDFLogger.hh>

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// PDFSliceServer hosts tools for clients that speak the Model Context
// Protocol over standard input and output. Each message is a JSON-RPC
// 2.0 request, notification, or response on a line by itself. The
// server answers initialize, ping, tools/list, and tools/call, and
// handles one message at a time to completion.
//
// Tools are registered explicitly, normally once at startup before
// run() is called. A tool handler receives the "arguments" object of
// a tools/call request (an empty object if the client sent none) and
// returns the text of the result.
class PDFSliceServer
{
  public:
    typedef std::function<std::string(JSON const& arguments)> handler_t;

    PDFSLICE_DLL
    static std::string const& defaultProtocolVersion();

    PDFSLICE_DLL
    PDFSliceServer(std::string const& name, std::string const& version);

    // Throws std::logic_error if a tool with this name has already
    // been registered.
    PDFSLICE_DLL
    void registerTool(
        std::string const& name,
        std::string const& description,
        JSON input_schema,
        handler_t handler);

    // Informational messages go to the logger's info stream. When
    // standard output carries the protocol, as it does in run(), that
    // stream must be pointed elsewhere.
    PDFSLICE_DLL
    std::shared_ptr<QPDFLogger> getLogger();
    PDFSLICE_DLL
    void setLogger(std::shared_ptr<QPDFLogger>);

    // Handle a single message and return the response, or an empty
    // string if the message doesn't get one.
    PDFSLICE_DLL
    std::string handleMessage(std::string const& message);

    // Read messages from in, one per line, and write responses to out
    // until in is exhausted.
    PDFSLICE_DLL
    void run(std::istream& in, std::ostream& out);

  private:
    struct Tool
    {
        std::string name;
        std::string description;
        JSON input_schema;
        handler_t handler;
    };

    JSON dispatch(std::string const& method, JSON const& params);
    void handleNotification(std::string const& method, JSON const& params);
    JSON initialize(JSON const& params);
    JSON listTools();
    JSON callTool(JSON const& params);

    class Members
    {
        friend class PDFSliceServer;

      public:
        PDFSLICE_DLL
        ~Members() = default;

      private:
        Members(std::string const& name, std::string const& version);
        Members(Members const&) = delete;

        std::string name;
        std::string version;
        std::shared_ptr<QPDFLogger> log;
        std::vector<Tool> tools;
    };
    std::shared_ptr<Members> m;
};

#endif // PDFSLICESERVER_HH
