#include "traceproxy/network/Buffer.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <iostream>
#include <string>

using traceproxy::network::Buffer;

static void testAppendRetrieve() {
    Buffer buf;
    assert(buf.ReadableBytes() == 0);
    buf.Append("hello ");
    buf.Append("world", 5);
    assert(buf.ReadableBytes() == 11);
    assert(std::string(buf.Peek(), 5) == "hello");

    buf.Retrieve(6);
    assert(buf.ReadableBytes() == 5);
    assert(std::string(buf.Peek(), buf.ReadableBytes()) == "world");

    // The consumed front is reclaimed without disturbing unread bytes.
    buf.Append("!");
    assert(buf.RetrieveAllAsString() == "world!");
    assert(buf.ReadableBytes() == 0);

    buf.Append("abc");
    buf.Retrieve(100);
    assert(buf.ReadableBytes() == 0);
}

// A burst larger than the spare capacity lands intact, spilled part included.
static void testReadFdLargeBurst() {
    int fds[2];
    assert(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    std::string payload;
    for (int i = 0; payload.size() < 20000; ++i) {
        payload += std::to_string(i) + ",";
    }
    assert(::write(fds[0], payload.data(), payload.size()) == static_cast<ssize_t>(payload.size()));

    Buffer buf;
    buf.Append("head:");
    std::string got;
    int savedErrno = 0;
    while (got.size() < payload.size() + 5) {
        const ssize_t n = buf.ReadFd(fds[1], &savedErrno);
        assert(n > 0);
        got = std::string(buf.Peek(), buf.ReadableBytes());
    }
    assert(got == "head:" + payload);

    ::close(fds[0]);
    assert(buf.ReadFd(fds[1], &savedErrno) == 0);
    assert(buf.ReadableBytes() == payload.size() + 5);
    ::close(fds[1]);

    assert(buf.ReadFd(-1, &savedErrno) < 0);
    assert(savedErrno == EBADF);
    assert(buf.ReadableBytes() == payload.size() + 5);
}

int main() {
    testAppendRetrieve();
    testReadFdLargeBurst();
    std::cout << "test_buffer passed" << std::endl;
    return 0;
}
