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

#define VIBE_LOG_TAG "WSCLIENT"

#include "transport/beast_websocket_client.hpp"

#include <deque>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "transport/websocket_url.hpp"

namespace vibe {

namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace ssl       = boost::asio::ssl;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;

namespace {
typedef websocket::stream<beast::tcp_stream>                   PlainStream;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> SecureStream;

const std::chrono::seconds kConnectTimeout(30);

std::string DescribeClose(const websocket::close_reason &aReason)
{
    std::string text = "closed with code " + std::to_string(aReason.code);

    if (!aReason.reason.empty())
    {
        text += ": " + std::string(aReason.reason.c_str());
    }

    return text;
}
} // namespace

/**
 * The I/O side of one connection attempt; only used on the io_context thread.
 *
 */
class BeastWebSocketClient::Session
{
public:
    virtual ~Session(void) = default;

    virtual void Start(void)                     = 0;
    virtual void Write(const std::string &aText) = 0;
    virtual void Close(void)                     = 0;
};

template <class Stream>
class BeastWebSocketClient::StreamSession : public BeastWebSocketClient::Session,
                                            public std::enable_shared_from_this<StreamSession<Stream>>
{
public:
    template <class... Args>
    StreamSession(BeastWebSocketClient &aClient, uint64_t aGeneration, const WebSocketUrl &aUrl, Args &&...aArgs)
        : mClient(aClient)
        , mGeneration(aGeneration)
        , mUrl(aUrl)
        , mResolver(aClient.mIoContext)
        , mStream(std::forward<Args>(aArgs)...)
        , mFinished(false)
        , mClosing(false)
    {
    }

    void Start(void) override
    {
        mResolver.async_resolve(mUrl.mHost, std::to_string(mUrl.mPort),
                                beast::bind_front_handler(&StreamSession::OnResolve, this->shared_from_this()));
    }

    void Write(const std::string &aText) override
    {
        bool writing = !mWriteQueue.empty();

        VerifyOrExit(!mFinished && !mClosing);

        mWriteQueue.push_back(aText);
        if (!writing)
        {
            DoWrite();
        }

    exit:
        return;
    }

    void Close(void) override
    {
        // The owner already moved on: nothing of this attempt is reported any more.
        mFinished = true;
        mClosing  = true;
        mResolver.cancel();

        if (mStream.is_open())
        {
            mStream.async_close(websocket::close_code::normal,
                                beast::bind_front_handler(&StreamSession::OnClose, this->shared_from_this()));
        }
        else
        {
            beast::get_lowest_layer(mStream).close();
        }
    }

private:
    void StartTransport(void);

    void OnResolve(beast::error_code aError, tcp::resolver::results_type aResults)
    {
        VerifyOrExit(!aError, Fail("resolve", aError));
        VerifyOrExit(!mClosing);

        beast::get_lowest_layer(mStream).expires_after(kConnectTimeout);
        beast::get_lowest_layer(mStream).async_connect(
            aResults, beast::bind_front_handler(&StreamSession::OnConnect, this->shared_from_this()));

    exit:
        return;
    }

    void OnConnect(beast::error_code aError, tcp::resolver::results_type::endpoint_type)
    {
        VerifyOrExit(!aError, Fail("connect", aError));
        VerifyOrExit(!mClosing);

        StartTransport();

    exit:
        return;
    }

    void OnTransportReady(beast::error_code aError)
    {
        VerifyOrExit(!aError, Fail("tls handshake", aError));
        VerifyOrExit(!mClosing);

        // The websocket stream has its own timeouts.
        beast::get_lowest_layer(mStream).expires_never();
        mStream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        mStream.set_option(websocket::stream_base::decorator([](websocket::request_type &aRequest) {
            aRequest.set(beast::http::field::user_agent, VIBE_PACKAGE_NAME "/" VIBE_PACKAGE_VERSION);
        }));
        mStream.async_handshake(mUrl.GetHostHeader(), mUrl.mTarget,
                                beast::bind_front_handler(&StreamSession::OnHandshake, this->shared_from_this()));

    exit:
        return;
    }

    void OnHandshake(beast::error_code aError)
    {
        VerifyOrExit(!aError, Fail("handshake", aError));
        VerifyOrExit(!mClosing);

        mStream.text(true);
        mClient.PostOpened(mGeneration);
        DoRead();

    exit:
        return;
    }

    void DoRead(void)
    {
        mStream.async_read(mReadBuffer, beast::bind_front_handler(&StreamSession::OnRead, this->shared_from_this()));
    }

    void OnRead(beast::error_code aError, size_t)
    {
        VerifyOrExit(!aError, Fail("read", aError));

        if (!mFinished)
        {
            mClient.PostMessage(mGeneration, beast::buffers_to_string(mReadBuffer.data()));
        }
        mReadBuffer.consume(mReadBuffer.size());
        DoRead();

    exit:
        return;
    }

    void DoWrite(void)
    {
        mStream.async_write(asio::buffer(mWriteQueue.front()),
                            beast::bind_front_handler(&StreamSession::OnWrite, this->shared_from_this()));
    }

    void OnWrite(beast::error_code aError, size_t)
    {
        VerifyOrExit(!aError, Fail("write", aError));

        mWriteQueue.pop_front();
        if (!mWriteQueue.empty() && !mClosing)
        {
            DoWrite();
        }

    exit:
        return;
    }

    void OnClose(beast::error_code aError)
    {
        if (aError)
        {
            vibeLogDebg("Close handshake failed: %s", aError.message().c_str());
        }
    }

    void Fail(const char *aWhat, beast::error_code aError)
    {
        std::string reason;

        VerifyOrExit(!mFinished);
        mFinished = true;

        if (aError == websocket::error::closed)
        {
            reason = DescribeClose(mStream.reason());
        }
        else
        {
            reason = std::string(aWhat) + ": " + aError.message();
        }

        mWriteQueue.clear();
        beast::get_lowest_layer(mStream).close();
        mClient.PostClosed(mGeneration, reason);

    exit:
        return;
    }

    BeastWebSocketClient       &mClient;
    uint64_t                    mGeneration;
    WebSocketUrl                mUrl;
    tcp::resolver               mResolver;
    Stream                      mStream;
    beast::flat_buffer          mReadBuffer;
    std::deque<std::string>     mWriteQueue;
    bool                        mFinished;
    bool                        mClosing;
};

template <> void BeastWebSocketClient::StreamSession<PlainStream>::StartTransport(void)
{
    OnTransportReady(beast::error_code());
}

template <> void BeastWebSocketClient::StreamSession<SecureStream>::StartTransport(void)
{
    beast::error_code error;

    if (!SSL_set_tlsext_host_name(mStream.next_layer().native_handle(), mUrl.mHost.c_str()))
    {
        error = beast::error_code(static_cast<int>(ERR_get_error()), asio::error::get_ssl_category());
        Fail("tls", error);
        ExitNow();
    }

    mStream.next_layer().set_verify_callback(ssl::host_name_verification(mUrl.mHost));
    mStream.next_layer().async_handshake(
        ssl::stream_base::client, beast::bind_front_handler(&StreamSession::OnTransportReady, this->shared_from_this()));

exit:
    return;
}

BeastWebSocketClient::BeastWebSocketClient(boost::asio::io_context &aIoContext, TaskRunner &aTaskRunner)
    : mIoContext(aIoContext)
    , mTaskRunner(aTaskRunner)
    , mSslContext(ssl::context::tls_client)
    , mGeneration(0)
    , mOpen(false)
{
    boost::system::error_code error;

    mSslContext.set_verify_mode(ssl::verify_peer);
    mSslContext.set_default_verify_paths(error);
    if (error)
    {
        vibeLogWarn("Failed to load the default certificate store: %s", error.message().c_str());
    }
}

BeastWebSocketClient::~BeastWebSocketClient(void)
{
    Close();
}

vibeError BeastWebSocketClient::Connect(const std::string &aUrl)
{
    vibeError                error = VIBE_ERROR_NONE;
    WebSocketUrl             url;
    std::shared_ptr<Session> session;

    Close();

    SuccessOrExit(error = ParseWebSocketUrl(aUrl, url), vibeLogWarn("Invalid WebSocket URL: %s", aUrl.c_str()));

    mGeneration++;
    if (url.mSecure)
    {
        session = std::make_shared<StreamSession<SecureStream>>(*this, mGeneration, url, mIoContext, mSslContext);
    }
    else
    {
        session = std::make_shared<StreamSession<PlainStream>>(*this, mGeneration, url, mIoContext);
    }

    mSession = session;
    vibeLogInfo("Connecting to %s", aUrl.c_str());
    asio::post(mIoContext, [session]() { session->Start(); });

exit:
    return error;
}

bool BeastWebSocketClient::Send(const std::string &aText)
{
    std::shared_ptr<Session> session = mSession;
    bool                     queued  = false;

    VerifyOrExit(mOpen && session != nullptr);

    asio::post(mIoContext, [session, aText]() { session->Write(aText); });
    queued = true;

exit:
    return queued;
}

void BeastWebSocketClient::Close(void)
{
    std::shared_ptr<Session> session = mSession;

    mOpen = false;
    VerifyOrExit(session != nullptr);

    // Any event of the abandoned attempt that is already queued is discarded.
    mGeneration++;
    mSession.reset();
    asio::post(mIoContext, [session]() { session->Close(); });

exit:
    return;
}

void BeastWebSocketClient::PostOpened(uint64_t aGeneration)
{
    mTaskRunner.Post([this, aGeneration]() {
        VerifyOrExit(aGeneration == mGeneration);
        mOpen = true;
        if (mDelegate != nullptr)
        {
            mDelegate->HandleClientOpened();
        }
    exit:
        return;
    });
}

void BeastWebSocketClient::PostMessage(uint64_t aGeneration, std::string aText)
{
    mTaskRunner.Post([this, aGeneration, aText]() {
        VerifyOrExit(aGeneration == mGeneration && mOpen);
        if (mDelegate != nullptr)
        {
            mDelegate->HandleClientMessage(aText);
        }
    exit:
        return;
    });
}

void BeastWebSocketClient::PostClosed(uint64_t aGeneration, std::string aReason)
{
    mTaskRunner.Post([this, aGeneration, aReason]() {
        VerifyOrExit(aGeneration == mGeneration);
        mOpen = false;
        mSession.reset();
        vibeLogInfo("Connection closed: %s", aReason.c_str());
        if (mDelegate != nullptr)
        {
            mDelegate->HandleClientClosed(aReason);
        }
    exit:
        return;
    });
}

} // namespace vibe
