#include "traceproxy/network/TcpServer.h"
#include "traceproxy/network/Acceptor.h"
#include "traceproxy/network/EventLoop.h"
#include "traceproxy/network/Socket.h"
#include "traceproxy/common/Logger.h"

namespace traceproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name)
    : loop_(loop),
      listenAddr_(listenAddr),
      hostport_(listenAddr.toIpPort()),
      name_(std::move(name)),
      nextConnId_(1) {
}

TcpServer::~TcpServer() {
    acceptor_.reset();
    std::map<std::string, TcpConnectionPtr> left;
    left.swap(connections_);
    for (auto& item : left) {
        const TcpConnectionPtr& conn = item.second;
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetCloseCallback(CloseCallback());
        conn->ConnectDestroyed();
    }
}

bool TcpServer::Start(std::string* err) {
    if (acceptor_) return true;

    std::unique_ptr<Acceptor> acceptor(new Acceptor(loop_, listenAddr_));
    if (!acceptor->Listen(err)) return false;
    acceptor->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { OnAccepted(sockfd, peerAddr); });
    acceptor_ = std::move(acceptor);
    LOG_INFO << "TcpServer[" << name_ << "] listening on " << hostport_;
    return true;
}

void TcpServer::Stop() {
    if (!acceptor_) return;
    acceptor_.reset();
    LOG_INFO << "TcpServer[" << name_ << "] closed " << hostport_ << ", " << connections_.size()
             << " connection(s) still open";
}

void TcpServer::OnAccepted(int sockfd, const InetAddress& peerAddr) {
    const std::string connName = name_ + "#" + std::to_string(nextConnId_++);
    LOG_DEBUG << "TcpServer[" << name_ << "] accepted " << connName << " from " << peerAddr.toIpPort();

    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        loop_, connName, sockfd, InetAddress(Socket::GetLocalAddr(sockfd)), peerAddr);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetPeerHalfCloseCallback(peerHalfCloseCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnClosed(c); });
    connections_[connName] = conn;
    conn->ConnectEstablished();
}

void TcpServer::OnClosed(const TcpConnectionPtr& conn) {
    connections_.erase(conn->name());
    // The connection is still dispatching; its channel goes once the loop is done with it.
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace traceproxy
