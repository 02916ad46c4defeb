#include "traceproxy/network/TcpClient.h"
#include "traceproxy/network/Channel.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/network/Socket.h"
#include "traceproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace traceproxy {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name)
    : loop_(loop),
      serverAddr_(serverAddr),
      name_(std::move(name)) {
}

TcpClient::~TcpClient() {
    if (connecting_) {
        connecting_->DisableAll();
        connecting_->Remove();
        ::close(connecting_->fd());
    }
    if (connection_) {
        // Nobody is left to hear about the close; just finish the teardown.
        TcpConnectionPtr conn = connection_;
        EventLoop* loop = loop_;
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback(MessageCallback());
        conn->SetPeerHalfCloseCallback(PeerHalfCloseCallback());
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
            loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
        });
        conn->ForceClose();
    }
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient[" << name_ << "] connecting to " << serverAddr_.toIpPort();
    const int sockfd = Socket::CreateNonblocking();
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "TcpClient[" << name_ << "] cannot create socket: " << std::strerror(err);
        if (connectFailedCallback_) connectFailedCallback_(err);
        return;
    }

    const int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int err = ret == 0 ? 0 : errno;
    if (err != 0 && err != EINPROGRESS && err != EINTR && err != EISCONN) {
        Fail(sockfd, err);
        return;
    }

    connecting_.reset(new Channel(loop_, sockfd));
    connecting_->SetWriteCallback([this]() { OnConnectWritable(); });
    connecting_->SetErrorCallback([this]() { OnConnectError(); });
    connecting_->EnableWriting();
}

// Stops watching the connecting socket and hands its fd back.
int TcpClient::ReleaseConnecting() {
    const int sockfd = connecting_->fd();
    connecting_->DisableAll();
    connecting_->Remove();
    // The channel may be dispatching right now; the loop drops it afterwards.
    std::shared_ptr<Channel> channel(std::move(connecting_));
    loop_->QueueInLoop([channel]() {});
    return sockfd;
}

void TcpClient::OnConnectWritable() {
    if (!connecting_) return;
    const int sockfd = ReleaseConnecting();
    const int err = Socket::GetSocketError(sockfd);
    if (err != 0) {
        Fail(sockfd, err);
    } else {
        Established(sockfd);
    }
}

void TcpClient::OnConnectError() {
    if (!connecting_) return;
    const int sockfd = ReleaseConnecting();
    const int err = Socket::GetSocketError(sockfd);
    Fail(sockfd, err != 0 ? err : ECONNREFUSED);
}

void TcpClient::Fail(int sockfd, int err) {
    ::close(sockfd);
    LOG_WARN << "TcpClient[" << name_ << "] connect to " << serverAddr_.toIpPort() << " failed: "
             << std::strerror(err);
    if (connectFailedCallback_) connectFailedCallback_(err);
}

void TcpClient::Established(int sockfd) {
    const InetAddress peerAddr(Socket::GetPeerAddr(sockfd));
    const InetAddress localAddr(Socket::GetLocalAddr(sockfd));
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        loop_, name_ + ":" + peerAddr.toIpPort(), sockfd, localAddr, peerAddr);

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetPeerHalfCloseCallback(peerHalfCloseCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnClosed(c); });
    connection_ = conn;
    conn->ConnectEstablished();
}

void TcpClient::OnClosed(const TcpConnectionPtr& conn) {
    connection_.reset();
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace traceproxy
