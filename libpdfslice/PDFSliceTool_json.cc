#include <pdfslice/PDFSliceTool.hh>

#include <pdfslice/Util.hh>

#include <qpdf/QUtil.hh>

#include <limits>
#include <stdexcept>

using namespace pdfslice;

namespace
{
    // A member that is missing or null is absent.
    bool
    get_argument(JSON const& arguments, std::string const& key, JSON& value)
    {
        return util::get_member(arguments, key, value) && !value.isNull();
    }

    bool
    is_integer_syntax(std::string const& str)
    {
        size_t i = 0;
        if ((!str.empty()) && ((str.at(0) == '-') || (str.at(0) == '+'))) {
            ++i;
        }
        if (i == str.length()) {
            return false;
        }
        for (; i < str.length(); ++i) {
            if (!QUtil::is_digit(str.at(i))) {
                return false;
            }
        }
        return true;
    }

    bool
    get_int(JSON const& j, int& value)
    {
        std::string str;
        if (!(j.getNumber(str) || j.getString(str))) {
            return false;
        }
        if (!is_integer_syntax(str)) {
            return false;
        }
        long long ll = 0;
        try {
            ll = QUtil::string_to_ll(str.c_str());
        } catch (std::runtime_error&) {
            // out of range for long long
            return false;
        }
        if ((ll < std::numeric_limits<int>::min()) || (ll > std::numeric_limits<int>::max())) {
            return false;
        }
        value = static_cast<int>(ll);
        return true;
    }

    bool
    get_bool(JSON const& j, bool& value)
    {
        if (j.getBool(value)) {
            return true;
        }
        std::string str;
        if (j.getString(str)) {
            if (str == "true") {
                value = true;
                return true;
            } else if (str == "false") {
                value = false;
                return true;
            }
        }
        return false;
    }
} // namespace

JSON
PDFSliceTool::inputSchema()
{
    return JSON::parse(R"({
  "type": "object",
  "properties": {
    "file_path": {
      "type": "string",
      "description": "The path to the PDF file to split"
    },
    "start_page": {
      "type": "integer",
      "minimum": 1,
      "default": 1,
      "description": "The start page number (1-indexed)"
    },
    "end_page": {
      "type": "integer",
      "minimum": 1,
      "default": 1,
      "description": "The end page number (1-indexed)"
    },
    "save_output": {
      "type": "boolean",
      "default": false,
      "description": "Whether to save the new PDF file with the extracted pages"
    }
  },
  "required": ["file_path"]
})");
}

PDFSliceValidation
PDFSliceTool::validateJSON(JSON const& arguments)
{
    if (!arguments.isDictionary()) {
        return PDFSliceValidation::failure("arguments must be an object");
    }

    PDFSliceArgs args;
    JSON value = JSON::makeNull();
    if (!get_argument(arguments, "file_path", value)) {
        return PDFSliceValidation::failure("file_path is required");
    }
    if (!value.getString(args.file_path)) {
        return PDFSliceValidation::failure("file_path must be a string");
    }
    if (get_argument(arguments, "start_page", value) && !get_int(value, args.start_page)) {
        return PDFSliceValidation::failure("start_page must be an integer");
    }
    if (get_argument(arguments, "end_page", value) && !get_int(value, args.end_page)) {
        return PDFSliceValidation::failure("end_page must be an integer");
    }
    for (auto const& key: {"save_output", "save_pdf"}) {
        if (get_argument(arguments, key, value) && !get_bool(value, args.save_output)) {
            return PDFSliceValidation::failure(std::string(key) + " must be a boolean");
        }
    }
    return PDFSliceValidation::validate(args);
}
