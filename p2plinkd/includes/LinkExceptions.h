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

#include "cotask/CoExceptions.h"
#include <string>

namespace p2plink
{
    using namespace cotask;

    /**
     * @brief Base class for link establishment failures.
     *
     * what() is the message reported to onFailure().
     */
    class LinkException : public CoException
    {
    public:
        using base = CoException;

        LinkException(const std::string &message)
            : message(message)
        {
        }

        virtual const char *what() const noexcept
        {
            return message.c_str();
        }

        /**
         * @brief The failure message to report when removing the group afterwards also failed.
         */
        virtual std::string CleanupFailedMessage() const
        {
            return message + ", cleanup failed";
        }

    private:
        std::string message;
    };

    /**
     * @brief A PeerConnectionAPI call failed.
     *
     * code() is one of the P2pErrorCode values.
     */
    class P2pOperationException : public LinkException
    {
    public:
        using base = LinkException;

        P2pOperationException(int code, const std::string &operation, const std::string &detail = "");

        int code() const { return code_; }
        const std::string &operation() const { return operation_; }

    private:
        int code_;
        std::string operation_;
    };

    /**
     * @brief All connect attempts failed.
     */
    class ConnectFailedException : public LinkException
    {
    public:
        using base = LinkException;

        ConnectFailedException(int code);

        int code() const { return code_; }

    private:
        int code_;
    };

    /**
     * @brief Connection info never reported a formed group.
     */
    class GroupFormationException : public LinkException
    {
    public:
        using base = LinkException;
        GroupFormationException(const std::string &message)
            : base(message)
        {
        }
    };

    class GroupInfoUnavailableException : public LinkException
    {
    public:
        using base = LinkException;
        GroupInfoUnavailableException()
            : base("GO mode: group info unavailable")
        {
        }
    };

    class NoClientsException : public LinkException
    {
    public:
        using base = LinkException;
        NoClientsException()
            : base("GO with no clients, removed group")
        {
        }
        virtual std::string CleanupFailedMessage() const
        {
            return "GO with no clients, cleanup failed";
        }
    };

    class ClientNotFoundException : public LinkException
    {
    public:
        using base = LinkException;
        ClientNotFoundException(const std::string &peerAddress)
            : base("Client not found in group: " + peerAddress)
        {
        }
    };

    class AddressResolutionFailedException : public LinkException
    {
    public:
        using base = LinkException;
        AddressResolutionFailedException()
            : base("Could not resolve client IP")
        {
        }
    };

    /**
     * @brief A post-connect failure, after which removing the group also failed.
     */
    class CleanupFailedException : public LinkException
    {
    public:
        using base = LinkException;
        CleanupFailedException(const std::string &message)
            : base(message)
        {
        }
    };

    /**
     * @brief A link to the peer is already being established.
     */
    class ConnectionInProgressException : public LinkException
    {
    public:
        using base = LinkException;
        ConnectionInProgressException(const std::string &peerAddress)
            : base("Connection already in progress: " + peerAddress)
        {
        }
    };

} // namespace
