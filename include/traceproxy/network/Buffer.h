#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

namespace traceproxy {
namespace network {

// Byte queue for one direction of a connection: appended at the back, consumed from the
// front. Consumed space is reclaimed once it outgrows the unread bytes.
class Buffer {
public:
    Buffer() { data_.reserve(kMinReadSpace); }

    size_t ReadableBytes() const { return data_.size() - head_; }
    const char* Peek() const { return data_.data() + head_; }

    void Retrieve(size_t len);
    void RetrieveAll() {
        data_.clear();
        head_ = 0;
    }
    std::string RetrieveAllAsString();

    void Append(const char* data, size_t len);
    void Append(const std::string& str) { Append(str.data(), str.size()); }

    // One readv() from `fd`. Returns its result; on error `*savedErrno` holds errno.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    static const size_t kMinReadSpace = 4096;

    void Compact();

    std::vector<char> data_;
    size_t head_{0};
};

} // namespace network
} // namespace traceproxy
