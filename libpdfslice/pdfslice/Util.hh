#ifndef PDFSLICE_UTIL_HH
#define PDFSLICE_UTIL_HH

#include <qpdf/JSON.hh>
#include <qpdf/QUtil.hh>

#include <string>

namespace pdfslice::util
{
    inline bool
    is_blank(std::string const& s)
    {
        for (char ch: s) {
            if (!QUtil::is_space(ch)) {
                return false;
            }
        }
        return true;
    }

    // Normalize extracted text: lines end with a single "\n", carriage
    // returns and form feeds are dropped, trailing whitespace is
    // removed from each line, and leading and trailing blank lines are
    // removed.
    inline std::string
    tidy_text(std::string const& text)
    {
        std::string result;
        std::string line;
        auto flush = [&result, &line]() {
            while ((!line.empty()) && QUtil::is_space(line.back())) {
                line.pop_back();
            }
            if (!(result.empty() && line.empty())) {
                result += line;
                result += '\n';
            }
            line.clear();
        };
        for (char ch: text) {
            if (ch == '\n') {
                flush();
            } else if ((ch != '\r') && (ch != '\f')) {
                line += ch;
            }
        }
        flush();
        while ((!result.empty()) && (result.back() == '\n')) {
            result.pop_back();
        }
        return result;
    }

    // qpdf's JSON only allows dictionary members to be visited, so
    // this looks one up by visiting all of them. Returns false if j is
    // not a dictionary or doesn't have key.
    inline bool
    get_member(JSON const& j, std::string const& key, JSON& value)
    {
        bool found = false;
        j.forEachDictItem([&](std::string const& k, JSON v) {
            if (k == key) {
                value = v;
                found = true;
            }
        });
        return found;
    }

    // Serialize j on a single line. JSON::unparse pretty-prints, but
    // newlines within strings are always escaped, so every raw
    // newline and the indentation after it is formatting.
    inline std::string
    unparse_line(JSON const& j)
    {
        std::string pretty = j.unparse();
        std::string result;
        result.reserve(pretty.length());
        bool after_newline = false;
        for (char ch: pretty) {
            if (ch == '\n') {
                after_newline = true;
            } else if (after_newline && (ch == ' ')) {
                // indentation
            } else {
                after_newline = false;
                result += ch;
            }
        }
        return result;
    }
} // namespace pdfslice::util

#endif // PDFSLICE_UTIL_HH
