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
#include <memory>
#include <stdexcept>

namespace p2plink
{
    /**
     * @brief Minimal getopt-style command line parser.
     *
     * Accepts "-x value", "--name value", "--name=value", and bare flags for bool options.
     * Anything that isn't an option is collected in Arguments().
     */
    class CommandLineParser
    {
    private:
        class OptionBase
        {
        public:
            OptionBase(const std::string &name) : name(name) {}
            virtual ~OptionBase() {}
            const std::string &Name() const { return name; }
            virtual bool IsFlag() const { return false; }
            virtual void SetValue(const std::string &value) = 0;

        private:
            std::string name;
        };

        class StringOption : public OptionBase
        {
        public:
            StringOption(const std::string &name, std::string *pValue) : OptionBase(name), pValue(pValue) {}
            virtual void SetValue(const std::string &value) { *pValue = value; }

        private:
            std::string *pValue;
        };

        class BoolOption : public OptionBase
        {
        public:
            BoolOption(const std::string &name, bool *pValue) : OptionBase(name), pValue(pValue) {}
            virtual bool IsFlag() const { return true; }
            virtual void SetValue(const std::string &value)
            {
                if (value.empty() || value == "true" || value == "1")
                {
                    *pValue = true;
                }
                else if (value == "false" || value == "0")
                {
                    *pValue = false;
                }
                else
                {
                    throw std::invalid_argument("Expecting true or false: " + value);
                }
            }

        private:
            bool *pValue;
        };

        std::vector<std::unique_ptr<OptionBase>> options;
        std::vector<std::string> arguments;

        OptionBase *FindOption(const std::string &name)
        {
            for (auto &option : options)
            {
                if (option->Name() == name)
                {
                    return option.get();
                }
            }
            return nullptr;
        }

    public:
        void AddOption(const std::string &name, std::string *pValue)
        {
            options.push_back(std::make_unique<StringOption>(name, pValue));
        }
        void AddOption(const std::string &name, bool *pValue)
        {
            options.push_back(std::make_unique<BoolOption>(name, pValue));
        }

        const std::vector<std::string> &Arguments() const { return arguments; }

        /**
         * @throws std::invalid_argument on unknown options or missing or invalid values.
         */
        void Parse(int argc, const char *const *argv)
        {
            arguments.clear();
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                if (arg.length() < 2 || arg[0] != '-')
                {
                    arguments.push_back(arg);
                    continue;
                }
                std::string name = arg;
                std::string value;
                bool hasValue = false;
                auto equals = arg.find('=');
                if (equals != std::string::npos)
                {
                    name = arg.substr(0, equals);
                    value = arg.substr(equals + 1);
                    hasValue = true;
                }
                OptionBase *option = FindOption(name);
                if (option == nullptr)
                {
                    throw std::invalid_argument("Unknown option: " + name);
                }
                if (!hasValue && !option->IsFlag())
                {
                    if (i + 1 >= argc)
                    {
                        throw std::invalid_argument("Missing value for option " + name);
                    }
                    value = argv[++i];
                }
                try
                {
                    option->SetValue(value);
                }
                catch (const std::exception &e)
                {
                    throw std::invalid_argument("Invalid value for " + name + ". " + e.what());
                }
            }
        }
    };
}
