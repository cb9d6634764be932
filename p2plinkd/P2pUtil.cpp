/*
 * MIT License
 * 
 * Copyright (c) 2022 Robin E. R. Davies
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "includes/P2pUtil.h"
#include <sstream>
#include <cctype>

using namespace p2plink;
using namespace std;

int64_t p2plink::toInt64(const std::string &value)
{
    const char *p = value.c_str();
    int64_t sign = 1;
    if (*p == '+')
    {
        ++p;
    }
    else if (*p == '-')
    {
        sign = -1;
        ++p;
    }

    if (*p == '0' && (p[1] == 'X' || p[1] == 'x'))
    {
        p += 2;
        if (!*p)
        {
            throw invalid_argument("Invalid number: " + value);
        }
        int64_t result = 0;
        while (*p)
        {
            char c = *p++;
            int digit;
            if (c >= '0' && c <= '9')
            {
                digit = c - '0';
            }
            else if (c >= 'a' && c <= 'f')
            {
                digit = c - 'a' + 10;
            }
            else if (c >= 'A' && c <= 'F')
            {
                digit = c - 'A' + 10;
            }
            else
            {
                throw invalid_argument("Invalid number: " + value);
            }
            result = result * 16 + digit;
        }
        return sign * result;
    }
    else
    {
        // decimal
        if (!*p)
        {
            throw invalid_argument("Invalid number: " + value);
        }
        int64_t result = 0;
        while (isdigit(*p))
        {
            result = result * 10 + (*p++) - '0';
        }
        if (*p != 0)
        {
            throw invalid_argument("Invalid number: " + value);
        }
        return sign * result;
    }
}

std::vector<std::string> p2plink::split(const std::string &value, char delimiter)
{
    size_t start = 0;
    std::vector<std::string> result;
    while (start < value.length())
    {
        size_t pos = value.find_first_of(delimiter, start);
        if (pos == std::string::npos)
        {
            result.push_back(value.substr(start));
            break;
        }
        result.push_back(value.substr(start, pos - start));
        start = pos + 1;
        if (start == value.length())
        {
            // ends with a delimiter? Then there's an empty value at the end.
            result.push_back("");
        }
    }
    return result;
}

std::vector<std::string> p2plink::splitWhitespace(const std::string &value)
{
    std::vector<std::string> result;
    size_t i = 0;
    size_t end = value.length();
    while (i < end)
    {
        while (i < end && isspace((unsigned char)value[i]))
            ++i;
        size_t start = i;
        while (i < end && !isspace((unsigned char)value[i]))
            ++i;
        if (i != start)
        {
            result.push_back(value.substr(start, i - start));
        }
    }
    return result;
}

std::string p2plink::trim(const std::string &value)
{
    size_t start = 0;
    size_t end = value.length();
    while (start < end && isspace((unsigned char)value[start]))
        ++start;
    while (end > start && isspace((unsigned char)value[end - 1]))
        --end;
    return value.substr(start, end - start);
}

char p2plink::ansiToLower(char c)
{
    if (c >= 'A' && c <= 'Z')
    {
        return (char)(c - 'A' + 'a');
    }
    return c;
}

std::string p2plink::ansiToLower(const std::string &value)
{
    std::string result;
    result.reserve(value.length());
    for (char c : value)
    {
        result.push_back(ansiToLower(c));
    }
    return result;
}

bool p2plink::caseInsensitiveEquals(const std::string &left, const std::string &right)
{
    if (left.length() != right.length())
        return false;
    for (size_t i = 0; i < left.length(); ++i)
    {
        if (ansiToLower(left[i]) != ansiToLower(right[i]))
            return false;
    }
    return true;
}

std::string p2plink::EncodeString(const std::string &s)
{
    bool requiresEncoding = s.empty();

    for (char c : s)
    {
        switch (c)
        {
        case '\r':
        case '\n':
        case '\t':
        case '\\':
        case ' ':
        case '#':
        case '\"':
            requiresEncoding = true;
            break;
        default:
            break;
        }
    }
    if (!requiresEncoding)
        return s;

    stringstream ss;

    ss << '"';
    for (char c : s)
    {
        switch (c)
        {
        case '\0':
            // discard.
            break;
        case '\r':
            ss << "\\r";
            break;
        case '\n':
            ss << "\\n";
            break;
        case '\t':
            ss << "\\t";
            break;
        case '\\':
            ss << "\\\\";
            break;
        case '\"':
            ss << "\\\"";
            break;
        default:
            ss << c;
        }
    }
    ss << '"';
    return ss.str();
}

std::string p2plink::DecodeString(const std::string &value)
{
    if (value.length() == 0 || value[0] != '"')
    {
        return value;
    }
    if (value.length() < 2 || value[value.length() - 1] != '"')
    {
        throw std::invalid_argument("Invalid quoted string: " + value);
    }
    std::stringstream s;
    size_t end = value.length() - 1;
    for (size_t i = 1; i < end; ++i)
    {
        char c = value[i];
        if (c != '\\')
        {
            s << c;
            continue;
        }
        if (++i >= end)
        {
            throw std::invalid_argument("Invalid quoted string: " + value);
        }
        c = value[i];
        switch (c)
        {
        case 'r':
            s << '\r';
            break;
        case 't':
            s << '\t';
            break;
        case 'n':
            s << '\n';
            break;
        default:
            s << c;
            break;
        }
    }
    return s.str();
}
