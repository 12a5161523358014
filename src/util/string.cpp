#include <sstream>
#include <cstdarg>

#include "util/string.hpp"

TTuple SplitString(const std::string &str, const char sep, int max) {
    std::vector<std::string> tokens;
    std::istringstream ss(str);
    std::string tok;

    while(std::getline(ss, tok, sep)) {
        if (max && !--max) {
            std::string rem;
            std::getline(ss, rem);
            if (rem.length()) {
                tok += sep;
                tok += rem;
            }
        }
        tokens.push_back(tok);
    }

    return tokens;
}

std::string MergeEscapeStrings(const TTuple &tuple, char sep) {
    std::string rep = std::string("\\") + sep;
    std::stringstream ss;
    bool first = true;

    for (auto &str: tuple) {
        if (!first)
            ss << sep;
        first = false;

        for (auto c: str) {
            if (c == sep)
                ss << rep;
            else if (c == '\\')
                ss << "\\\\";
            else
                ss << c;
        }
    }

    return ss.str();
}

std::string StringTrim(const std::string& s, const std::string &what) {
    std::size_t first = s.find_first_not_of(what);
    std::size_t last  = s.find_last_not_of(what);

    if (first == std::string::npos || last == std::string::npos)
        return "";

    return s.substr(first, last - first + 1);
}

bool StringStartsWith(const std::string &str, const std::string &prefix) {
    if (str.length() < prefix.length())
        return false;

    return !str.compare(0, prefix.length(), prefix);
}

std::string StringFormatFlags(uint64_t flags,
                              const TFlagsNames &names,
                              const std::string sep) {
    std::stringstream result;
    bool first = true;

    for (auto &n : names) {
        if ((n.first & flags) == n.first && n.first) {
            if (first)
                first = false;
            else
                result << sep;
            result << n.second;
            flags &= ~n.first;
        }
    }

    if (flags) {
        if (!first)
            result << sep;
        result << std::hex << flags;
    }

    return result.str();
}

TError StringParseFlags(const std::string &str, const TFlagsNames &names,
                        uint64_t &result, const char sep) {
    std::stringstream ss(str);
    std::string name;

    result = 0;
    while (std::getline(ss, name, sep)) {
        bool found = false;
        name = StringTrim(name);
        if (name.empty())
            continue;
        for (auto &n: names) {
            if (n.second == name) {
                result |= n.first;
                found = true;
                break;
            }
        }
        if (!found)
            return TError(EError::InvalidValue, "Unknown flag \"" + name + "\"");
    }
    return OK;
}

std::string StringFormat(const char *format, ...) {
    std::string result;
    int length;
    va_list ap;

    va_start(ap, format);
    length = vsnprintf(nullptr, 0, format, ap);
    va_end(ap);

    result.resize(length);

    va_start(ap, format);
    vsnprintf(&result[0], length + 1, format, ap);
    va_end(ap);

    return result;
}
