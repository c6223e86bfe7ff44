#include <pdfslice/PDFSliceServer.hh>

#include <pdfslice/Util.hh>

#include <stdexcept>

using namespace pdfslice;

namespace
{
    // JSON-RPC 2.0 error codes
    int const e_parse = -32700;
    int const e_invalid_request = -32600;
    int const e_method_not_found = -32601;
    int const e_invalid_params = -32602;
    int const e_internal = -32603;

    class RPCError: public std::runtime_error
    {
      public:
        RPCError(int code, std::string const& message) :
            std::runtime_error(message),
            code(code)
        {
        }
        int code;
    };

    JSON
    make_message(JSON const& id)
    {
        auto j = JSON::makeDictionary();
        j.addDictionaryMember("jsonrpc", JSON::makeString("2.0"));
        j.addDictionaryMember("id", id);
        return j;
    }

    std::string
    make_result(JSON const& id, JSON const& result)
    {
        auto j = make_message(id);
        j.addDictionaryMember("result", result);
        return util::unparse_line(j);
    }

    std::string
    make_error(JSON const& id, int code, std::string const& message)
    {
        auto j = make_message(id);
        auto error = j.addDictionaryMember("error", JSON::makeDictionary());
        error.addDictionaryMember("code", JSON::makeInt(code));
        error.addDictionaryMember("message", JSON::makeString(message));
        return util::unparse_line(j);
    }
} // namespace

PDFSliceServer::Members::Members(std::string const& name, std::string const& version) :
    name(name),
    version(version),
    log(QPDFLogger::defaultLogger())
{
}

PDFSliceServer::PDFSliceServer(std::string const& name, std::string const& version) :
    m(new Members(name, version))
{
}

std::string const&
PDFSliceServer::defaultProtocolVersion()
{
    static std::string const version = "2024-11-05";
    return version;
}

void
PDFSliceServer::registerTool(
    std::string const& name, std::string const& description, JSON input_schema, handler_t handler)
{
    for (auto const& tool: m->tools) {
        if (tool.name == name) {
            throw std::logic_error("PDFSliceServer: tool " + name + " is already registered");
        }
    }
    m->tools.push_back({name, description, input_schema, handler});
}

std::shared_ptr<QPDFLogger>
PDFSliceServer::getLogger()
{
    return m->log;
}

void
PDFSliceServer::setLogger(std::shared_ptr<QPDFLogger> l)
{
    m->log = l;
}

void
PDFSliceServer::run(std::istream& in, std::ostream& out)
{
    m->log->info(m->name + ": ready to receive requests\n");
    std::string line;
    while (std::getline(in, line)) {
        if ((!line.empty()) && (line.back() == '\r')) {
            line.pop_back();
        }
        auto response = handleMessage(line);
        if (!response.empty()) {
            out << response << "\n" << std::flush;
        }
    }
    m->log->info(m->name + ": end of input\n");
}

std::string
PDFSliceServer::handleMessage(std::string const& message)
{
    if (util::is_blank(message)) {
        return "";
    }
    auto null_id = JSON::makeNull();
    auto msg = JSON::makeNull();
    try {
        msg = JSON::parse(message);
    } catch (std::exception& e) {
        return make_error(null_id, e_parse, std::string("Parse error: ") + e.what());
    }
    if (!msg.isDictionary()) {
        return make_error(null_id, e_invalid_request, "Invalid Request: not an object");
    }

    auto id = JSON::makeNull();
    bool has_id = util::get_member(msg, "id", id);
    auto method_j = JSON::makeNull();
    std::string method;
    if (!(util::get_member(msg, "method", method_j) && method_j.getString(method))) {
        auto ignored = JSON::makeNull();
        if (has_id &&
            (util::get_member(msg, "result", ignored) || util::get_member(msg, "error", ignored))) {
            // A response to something we never send; nothing to do.
            return "";
        }
        return make_error(has_id ? id : null_id, e_invalid_request, "Invalid Request: no method");
    }
    auto params = JSON::makeDictionary();
    util::get_member(msg, "params", params);

    if (!has_id) {
        handleNotification(method, params);
        return "";
    }
    try {
        return make_result(id, dispatch(method, params));
    } catch (RPCError& e) {
        m->log->error(m->name + ": " + method + ": " + e.what() + "\n");
        return make_error(id, e.code, e.what());
    } catch (std::exception& e) {
        m->log->error(m->name + ": " + method + ": " + e.what() + "\n");
        return make_error(id, e_internal, std::string("Internal error: ") + e.what());
    }
}

void
PDFSliceServer::handleNotification(std::string const& method, JSON const&)
{
    if (method == "notifications/initialized") {
        m->log->info(m->name + ": client initialized\n");
    } else {
        m->log->info(m->name + ": ignoring notification " + method + "\n");
    }
}

JSON
PDFSliceServer::dispatch(std::string const& method, JSON const& params)
{
    if (method == "initialize") {
        return initialize(params);
    } else if (method == "ping") {
        return JSON::makeDictionary();
    } else if (method == "tools/list") {
        return listTools();
    } else if (method == "tools/call") {
        return callTool(params);
    }
    throw RPCError(e_method_not_found, "Method not found: " + method);
}

JSON
PDFSliceServer::initialize(JSON const& params)
{
    std::string protocol_version = defaultProtocolVersion();
    auto value = JSON::makeNull();
    std::string requested;
    if (util::get_member(params, "protocolVersion", value) && value.getString(requested) &&
        !requested.empty()) {
        protocol_version = requested;
    }
    std::string client_name = "unknown";
    auto client_info = JSON::makeNull();
    if (util::get_member(params, "clientInfo", client_info) &&
        util::get_member(client_info, "name", value)) {
        value.getString(client_name);
    }
    m->log->info(
        m->name + ": initialize from client " + client_name + ", protocol version " +
        protocol_version + "\n");

    auto result = JSON::makeDictionary();
    result.addDictionaryMember("protocolVersion", JSON::makeString(protocol_version));
    auto capabilities = result.addDictionaryMember("capabilities", JSON::makeDictionary());
    auto tools = capabilities.addDictionaryMember("tools", JSON::makeDictionary());
    tools.addDictionaryMember("listChanged", JSON::makeBool(false));
    auto server_info = result.addDictionaryMember("serverInfo", JSON::makeDictionary());
    server_info.addDictionaryMember("name", JSON::makeString(m->name));
    server_info.addDictionaryMember("version", JSON::makeString(m->version));
    return result;
}

JSON
PDFSliceServer::listTools()
{
    auto result = JSON::makeDictionary();
    auto tools = result.addDictionaryMember("tools", JSON::makeArray());
    for (auto const& tool: m->tools) {
        auto j = tools.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("name", JSON::makeString(tool.name));
        j.addDictionaryMember("description", JSON::makeString(tool.description));
        j.addDictionaryMember("inputSchema", tool.input_schema);
    }
    return result;
}

JSON
PDFSliceServer::callTool(JSON const& params)
{
    auto value = JSON::makeNull();
    std::string name;
    if (!(util::get_member(params, "name", value) && value.getString(name))) {
        throw RPCError(e_invalid_params, "tools/call requires a tool name");
    }
    Tool const* tool = nullptr;
    for (auto const& t: m->tools) {
        if (t.name == name) {
            tool = &t;
            break;
        }
    }
    if (tool == nullptr) {
        throw RPCError(e_invalid_params, "Unknown tool: " + name);
    }
    auto arguments = JSON::makeDictionary();
    util::get_member(params, "arguments", arguments);

    auto text = tool->handler(arguments);

    auto result = JSON::makeDictionary();
    auto content = result.addDictionaryMember("content", JSON::makeArray());
    auto item = content.addArrayElement(JSON::makeDictionary());
    item.addDictionaryMember("type", JSON::makeString("text"));
    item.addDictionaryMember("text", JSON::makeString(text));
    result.addDictionaryMember("isError", JSON::makeBool(false));
    return result;
}
