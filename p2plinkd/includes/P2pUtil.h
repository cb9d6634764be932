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

#pragma once

#include <string>
#include <vector>
#include <concepts>
#include <stdexcept>
#include <cstdint>
#include <utility>

namespace p2plink
{
    /**
     * @brief Convert a string to an int64_t.
     *
     * Accepts either decimal or (if the value is prefixed with "0x") hexadecimal input.
     * @param value The string to parse.
     * @return int64_t The parsed value.
     * @throws std::invalid_argument if the supplied string is not a valid int64_t.
     */
    int64_t toInt64(const std::string &value);

    /**
     * @brief Convert a string to an integer.
     *
     * @tparam T A signed or unsigned integral type.
     * @param value The string to parse.
     * @return T The parsed result.
     * @throws std::invalid_argument if the supplied string is not a valid integer.
     * @throws std::range_error if the resulting value does not fit into T.
     */
    template <std::integral T>
    T toInt(const std::string &value)
    {
        int64_t result = toInt64(value);
        T typedResult = (T)result;
        if ((int64_t)typedResult != result)
        {
            throw std::range_error("Out of range.");
        }
        return typedResult;
    }

    /**
     * @brief Split the supplied string using the supplied delimiter.
     *
     * @param value Input value.
     * @param delimiter The character to use as a list delimiter.
     * @return std::vector<std::string>
     */
    std::vector<std::string> split(const std::string &value, char delimiter);

    /**
     * @brief Split on runs of whitespace, discarding empty fields.
     */
    std::vector<std::string> splitWhitespace(const std::string &value);

    std::string trim(const std::string &value);

    char ansiToLower(char c);
    std::string ansiToLower(const std::string &value);

    bool caseInsensitiveEquals(const std::string &left, const std::string &right);

    /**
     * @brief Quote a string for a configuration file, if it needs quoting.
     */
    std::string EncodeString(const std::string &s);

    /**
     * @brief Remove quotes and escapes from a (possibly) quoted configuration value.
     *
     * @throws std::invalid_argument if the quoted string is malformed.
     */
    std::string DecodeString(const std::string &value);

    /**
     * @brief Run a function when the enclosing scope exits, unless disabled.
     */
    template <typename FN>
    class Finally
    {
    public:
        Finally(FN &&fn) : fn(std::move(fn)) {}
        Finally(const Finally &) = delete;
        Finally &operator=(const Finally &) = delete;
        ~Finally()
        {
            if (enabled)
            {
                fn();
            }
        }
        void disable() { enabled = false; }

    private:
        FN fn;
        bool enabled = true;
    };

    template <typename FN>
    Finally<FN> finally(FN &&fn)
    {
        return Finally<FN>(std::forward<FN>(fn));
    }

} // namespace.
