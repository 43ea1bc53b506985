/*
 *    Copyright (c) 2026, The Vibe Agent Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

#define VIBE_LOG_TAG "WSSERVER"

#include "transport/beast_websocket_server.hpp"

#include <algorithm>
#include <deque>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace vibe {

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

/**
 * One accepted connection; only used on the io_context thread.
 *
 */
class BeastWebSocketServer::Session : public std::enable_shared_from_this<Session>
{
public:
    Session(BeastWebSocketServer &aServer, ConnectionId aConnection, tcp::socket aSocket)
        : mServer(aServer)
        , mConnection(aConnection)
        , mStream(std::move(aSocket))
        , mOpened(false)
        , mFinished(false)
        , mCloseRequested(false)
        , mCloseReason(websocket::close_code::normal)
    {
    }

    void Start(void)
    {
        mStream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        mStream.set_option(websocket::stream_base::decorator([](websocket::response_type &aResponse) {
            aResponse.set(beast::http::field::server, VIBE_PACKAGE_NAME "/" VIBE_PACKAGE_VERSION);
        }));
        mStream.async_accept(beast::bind_front_handler(&Session::OnAccept, shared_from_this()));
    }

    void Write(const std::string &aText)
    {
        bool writing = !mWriteQueue.empty();

        VerifyOrExit(mOpened && !mFinished && !mCloseRequested);

        mWriteQueue.push_back(aText);
        if (!writing)
        {
            DoWrite();
        }

    exit:
        return;
    }

    /**
     * Starts the close handshake once every queued frame is written.
     *
     */
    void Close(const websocket::close_reason &aReason)
    {
        VerifyOrExit(!mFinished && !mCloseRequested);

        mCloseRequested = true;
        mCloseReason    = aReason;
        if (!mOpened)
        {
            beast::get_lowest_layer(mStream).close();
        }
        else if (mWriteQueue.empty())
        {
            DoClose();
        }

    exit:
        return;
    }

    /**
     * Drops the connection without reporting it.
     *
     */
    void Abort(void)
    {
        mFinished = true;
        beast::get_lowest_layer(mStream).close();
    }

private:
    void OnAccept(beast::error_code aError)
    {
        VerifyOrExit(!aError, Finish("accept", aError));

        mOpened = true;
        mStream.text(true);
        mServer.PostOpened(mConnection);

        if (mCloseRequested)
        {
            DoClose();
        }
        DoRead();

    exit:
        return;
    }

    void DoRead(void)
    {
        mStream.async_read(mReadBuffer, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code aError, size_t)
    {
        VerifyOrExit(!aError, Finish("read", aError));

        mServer.PostMessage(mConnection, beast::buffers_to_string(mReadBuffer.data()));
        mReadBuffer.consume(mReadBuffer.size());
        DoRead();

    exit:
        return;
    }

    void DoWrite(void)
    {
        mStream.async_write(asio::buffer(mWriteQueue.front()),
                            beast::bind_front_handler(&Session::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code aError, size_t)
    {
        VerifyOrExit(!aError, Finish("write", aError));

        mWriteQueue.pop_front();
        if (!mWriteQueue.empty())
        {
            DoWrite();
        }
        else if (mCloseRequested)
        {
            DoClose();
        }

    exit:
        return;
    }

    void DoClose(void)
    {
        mStream.async_close(mCloseReason, beast::bind_front_handler(&Session::OnClose, shared_from_this()));
    }

    void OnClose(beast::error_code aError)
    {
        // The pending read completes with `closed` and reports the connection.
        if (aError)
        {
            Finish("close", aError);
        }
    }

    void Finish(const char *aWhat, beast::error_code aError)
    {
        VerifyOrExit(!mFinished);
        mFinished = true;

        if (aError != websocket::error::closed)
        {
            vibeLogDebg("Connection %llu %s: %s", static_cast<unsigned long long>(mConnection), aWhat,
                        aError.message().c_str());
        }

        mWriteQueue.clear();
        beast::get_lowest_layer(mStream).close();
        mServer.mSessions.erase(mConnection);
        if (mOpened)
        {
            mServer.PostClosed(mConnection);
        }

    exit:
        return;
    }

    BeastWebSocketServer                &mServer;
    ConnectionId                         mConnection;
    websocket::stream<beast::tcp_stream> mStream;
    beast::flat_buffer                   mReadBuffer;
    std::deque<std::string>              mWriteQueue;
    bool                                 mOpened;
    bool                                 mFinished;
    bool                                 mCloseRequested;
    websocket::close_reason              mCloseReason;
};

BeastWebSocketServer::BeastWebSocketServer(boost::asio::io_context &aIoContext, TaskRunner &aTaskRunner)
    : mIoContext(aIoContext)
    , mTaskRunner(aTaskRunner)
    , mAcceptor(aIoContext)
    , mPort(0)
    , mStopped(true)
    , mNextConnectionId(kInvalidConnectionId + 1)
{
}

vibeError BeastWebSocketServer::Start(const std::string &aAddress, uint16_t aPort)
{
    vibeError                 error = VIBE_ERROR_NONE;
    boost::system::error_code ec;
    asio::ip::address         address;
    tcp::endpoint             endpoint;

    VerifyOrExit(mStopped, error = VIBE_ERROR_INVALID_STATE);

    address = asio::ip::make_address(aAddress, ec);
    VerifyOrExit(!ec, error = VIBE_ERROR_INVALID_ARGS);
    endpoint = tcp::endpoint(address, aPort);

    mAcceptor.open(endpoint.protocol(), ec);
    VerifyOrExit(!ec, error = VIBE_ERROR_ERRNO);
    mAcceptor.set_option(asio::socket_base::reuse_address(true), ec);
    VerifyOrExit(!ec, error = VIBE_ERROR_ERRNO);
    mAcceptor.bind(endpoint, ec);
    VerifyOrExit(!ec, error = VIBE_ERROR_ERRNO);
    mAcceptor.listen(asio::socket_base::max_listen_connections, ec);
    VerifyOrExit(!ec, error = VIBE_ERROR_ERRNO);

    mPort    = mAcceptor.local_endpoint().port();
    mStopped = false;
    vibeLogInfo("Listening on ws://%s:%u", aAddress.c_str(), mPort);

    asio::post(mIoContext, [this]() { DoAccept(); });

exit:
    if (ec)
    {
        boost::system::error_code ignored;

        vibeLogWarn("Failed to listen on %s:%u: %s", aAddress.c_str(), aPort, ec.message().c_str());
        errno = ec.value();
        mAcceptor.close(ignored);
    }
    return error;
}

void BeastWebSocketServer::Stop(void)
{
    VerifyOrExit(!mStopped);

    mStopped = true;
    mPort    = 0;
    mOpenConnections.clear();
    asio::post(mIoContext, [this]() {
        boost::system::error_code ignored;

        mAcceptor.close(ignored);
        for (auto &entry : mSessions)
        {
            entry.second->Abort();
        }
        mSessions.clear();
    });
    vibeLogInfo("Listener stopped");

exit:
    return;
}

bool BeastWebSocketServer::Send(ConnectionId aConnection, const std::string &aText)
{
    bool queued = false;

    VerifyOrExit(mOpenConnections.count(aConnection) != 0);

    asio::post(mIoContext, [this, aConnection, aText]() {
        auto it = mSessions.find(aConnection);

        if (it != mSessions.end())
        {
            it->second->Write(aText);
        }
    });
    queued = true;

exit:
    return queued;
}

void BeastWebSocketServer::Close(ConnectionId aConnection, uint16_t aCode, const std::string &aReason)
{
    VerifyOrExit(mOpenConnections.count(aConnection) != 0);

    asio::post(mIoContext, [this, aConnection, aCode, aReason]() {
        auto it = mSessions.find(aConnection);

        if (it != mSessions.end())
        {
            websocket::close_reason reason(aCode);

            reason.reason.assign(aReason.data(), std::min(aReason.size(), reason.reason.max_size()));
            it->second->Close(reason);
        }
    });

exit:
    return;
}

void BeastWebSocketServer::DoAccept(void)
{
    mAcceptor.async_accept(beast::bind_front_handler(&BeastWebSocketServer::OnAccept, this));
}

void BeastWebSocketServer::OnAccept(boost::system::error_code aError, tcp::socket aSocket)
{
    std::shared_ptr<Session> session;
    ConnectionId             connection;

    if (aError == asio::error::operation_aborted || !mAcceptor.is_open())
    {
        ExitNow();
    }

    if (aError)
    {
        vibeLogWarn("Failed to accept: %s", aError.message().c_str());
    }
    else
    {
        connection = mNextConnectionId++;
        session    = std::make_shared<Session>(*this, connection, std::move(aSocket));
        mSessions[connection] = session;
        session->Start();
    }

    DoAccept();

exit:
    return;
}

void BeastWebSocketServer::PostOpened(ConnectionId aConnection)
{
    mTaskRunner.Post([this, aConnection]() {
        VerifyOrExit(!mStopped);
        mOpenConnections.insert(aConnection);
        vibeLogDebg("Connection %llu opened", static_cast<unsigned long long>(aConnection));
        if (mDelegate != nullptr)
        {
            mDelegate->HandleConnectionOpened(aConnection);
        }
    exit:
        return;
    });
}

void BeastWebSocketServer::PostMessage(ConnectionId aConnection, std::string aText)
{
    mTaskRunner.Post([this, aConnection, aText]() {
        VerifyOrExit(mOpenConnections.count(aConnection) != 0);
        if (mDelegate != nullptr)
        {
            mDelegate->HandleConnectionMessage(aConnection, aText);
        }
    exit:
        return;
    });
}

void BeastWebSocketServer::PostClosed(ConnectionId aConnection)
{
    mTaskRunner.Post([this, aConnection]() {
        VerifyOrExit(mOpenConnections.erase(aConnection) != 0);
        vibeLogDebg("Connection %llu closed", static_cast<unsigned long long>(aConnection));
        if (mDelegate != nullptr)
        {
            mDelegate->HandleConnectionClosed(aConnection);
        }
    exit:
        return;
    });
}

} // namespace vibe
