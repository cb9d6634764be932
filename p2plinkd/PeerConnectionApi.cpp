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

#include "includes/PeerConnectionApi.h"
#include "includes/LinkExceptions.h"
#include <stdexcept>
#include "ss.h"

using namespace p2plink;

std::string p2plink::ErrorCodeName(int code)
{
    switch (code)
    {
    case P2pErrorCode::ERROR:
        return "ERROR";
    case P2pErrorCode::P2P_UNSUPPORTED:
        return "P2P_UNSUPPORTED";
    case P2pErrorCode::BUSY:
        return "BUSY";
    default:
        return SS("UNKNOWN_" << code);
    }
}

void ConnectedClient::SetResolvedIp(const std::string &ip)
{
    if (resolvedIp.has_value())
    {
        if (*resolvedIp != ip)
        {
            throw std::logic_error(SS("Client " << deviceAddress << " already resolved to " << *resolvedIp));
        }
        return;
    }
    resolvedIp = ip;
}

static std::string OperationMessage(int code, const std::string &operation, const std::string &detail)
{
    if (detail.empty())
    {
        return SS(operation << " failed: " << ErrorCodeName(code));
    }
    return SS(operation << " failed: " << ErrorCodeName(code) << " (" << detail << ")");
}

P2pOperationException::P2pOperationException(int code, const std::string &operation, const std::string &detail)
    : base(OperationMessage(code, operation, detail)),
      code_(code),
      operation_(operation)
{
}

ConnectFailedException::ConnectFailedException(int code)
    : base("Connection failed: " + ErrorCodeName(code)),
      code_(code)
{
}
