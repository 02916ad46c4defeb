#include "traceproxy/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>

namespace traceproxy {
namespace network {

void Buffer::Retrieve(size_t len) {
    if (len >= ReadableBytes()) {
        RetrieveAll();
        return;
    }
    head_ += len;
    Compact();
}

std::string Buffer::RetrieveAllAsString() {
    std::string out(Peek(), ReadableBytes());
    RetrieveAll();
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    Compact();
    data_.insert(data_.end(), data, data + len);
}

void Buffer::Compact() {
    if (head_ > 0 && head_ >= ReadableBytes()) {
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
}

// Reads into the spare capacity first and spills into a stack buffer, so a single call
// can take a large burst without growing the buffer up front.
ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    Compact();
    const size_t used = data_.size();
    if (data_.capacity() - used < kMinReadSpace) {
        data_.reserve(used + kMinReadSpace);
    }
    data_.resize(data_.capacity());
    const size_t spare = data_.size() - used;

    char spill[65536];
    struct iovec vec[2];
    vec[0].iov_base = data_.data() + used;
    vec[0].iov_len = spare;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;

    const ssize_t n = ::readv(fd, vec, 2);
    if (n < 0) {
        *savedErrno = errno;
        data_.resize(used);
    } else if (static_cast<size_t>(n) <= spare) {
        data_.resize(used + static_cast<size_t>(n));
    } else {
        data_.insert(data_.end(), spill, spill + (static_cast<size_t>(n) - spare));
    }
    return n;
}

} // namespace network
} // namespace traceproxy
