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
#include <chrono>
#include <stdexcept>
#include "Ipv4Subnet.h"

namespace p2plink::config_serializer
{
    // Text conversions for configuration values.

    void ParseConfigValue(const std::string &text, int *pValue);
    void ParseConfigValue(const std::string &text, bool *pValue);
    void ParseConfigValue(const std::string &text, std::string *pValue);
    void ParseConfigValue(const std::string &text, std::chrono::milliseconds *pValue);
    void ParseConfigValue(const std::string &text, Ipv4Subnet *pValue);

    std::string FormatConfigValue(int value);
    std::string FormatConfigValue(bool value);
    std::string FormatConfigValue(const std::string &value);
    std::string FormatConfigValue(std::chrono::milliseconds value);
    std::string FormatConfigValue(const Ipv4Subnet &value);

    template <typename CLASS>
    class ConfigSerializerBase
    {
    public:
        ConfigSerializerBase(const std::string &name, const std::string &comment)
            : name(name), comment(comment)
        {
        }
        virtual ~ConfigSerializerBase() {}

        const std::string &Name() const { return name; }
        const std::string &Comment() const { return comment; }

        virtual void SetValue(CLASS &object, const std::string &text) const = 0;
        virtual std::string GetValue(const CLASS &object) const = 0;

    private:
        std::string name;
        std::string comment;
    };

    template <typename CLASS, typename T>
    class ConfigSerializer : public ConfigSerializerBase<CLASS>
    {
    public:
        using base = ConfigSerializerBase<CLASS>;

        ConfigSerializer(const std::string &name, T CLASS::*pMember, const std::string &comment)
            : base(name, comment), pMember(pMember)
        {
        }

        virtual void SetValue(CLASS &object, const std::string &text) const
        {
            ParseConfigValue(text, &(object.*pMember));
        }
        virtual std::string GetValue(const CLASS &object) const
        {
            return FormatConfigValue(object.*pMember);
        }

    private:
        T CLASS::*pMember;
    };
}
