#include "utils/buffer.hpp"
#include <cstring>
#include <algorithm>

namespace stream_http {
namespace utils {

constexpr size_t Buffer::MIN_CAPACITY;
const size_t Buffer::npos = static_cast<size_t>(-1);

Buffer::Buffer()
    : read_idx_(0), write_idx_(0)
{
}

Buffer::~Buffer() = default;

Buffer::Buffer(Buffer&& other) noexcept
    : data_(std::move(other.data_))
    , read_idx_(other.read_idx_)
    , write_idx_(other.write_idx_)
{
    other.read_idx_ = 0;
    other.write_idx_ = 0;
}

Buffer& Buffer::operator=(Buffer&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        read_idx_ = other.read_idx_;
        write_idx_ = other.write_idx_;
        other.read_idx_ = 0;
        other.write_idx_ = 0;
    }
    return *this;
}

void Buffer::append(const uint8_t* data, size_t len) {
    if (len == 0 || data == nullptr) {
        return;
    }
    ensure_writable(len);
    std::memcpy(data_.data() + write_idx_, data, len);
    write_idx_ += len;
}

void Buffer::append(const char* data, size_t len) {
    append(reinterpret_cast<const uint8_t*>(data), len);
}

void Buffer::consume(size_t len) {
    read_idx_ += std::min(len, readable_bytes());
    if (read_idx_ == write_idx_) {
        // 全部消费完，直接归零，无需搬移
        read_idx_ = 0;
        write_idx_ = 0;
        return;
    }
    if (read_idx_ > data_.size() / 2) {
        compact();
    }
}

const uint8_t* Buffer::data() const {
    return data_.data() + read_idx_;
}

std::string Buffer::view() const {
    return std::string(reinterpret_cast<const char*>(data()), readable_bytes());
}

std::string Buffer::peek(size_t len) const {
    size_t n = std::min(len, readable_bytes());
    return std::string(reinterpret_cast<const char*>(data()), n);
}

size_t Buffer::find(const char* pattern, size_t pattern_len) const {
    size_t readable = readable_bytes();
    if (pattern_len == 0 || pattern_len > readable) {
        return npos;
    }
    const uint8_t* begin = data();
    const uint8_t* end = begin + readable;
    const uint8_t* pat = reinterpret_cast<const uint8_t*>(pattern);
    const uint8_t* it = std::search(begin, end, pat, pat + pattern_len);
    if (it == end) {
        return npos;
    }
    return static_cast<size_t>(it - begin);
}

size_t Buffer::readable_bytes() const {
    return write_idx_ - read_idx_;
}

size_t Buffer::capacity() const {
    return data_.size();
}

size_t Buffer::read_offset() const {
    return read_idx_;
}

void Buffer::clear() {
    read_idx_ = 0;
    write_idx_ = 0;
}

void Buffer::compact() {
    if (read_idx_ == 0) {
        return;
    }
    size_t data_len = write_idx_ - read_idx_;
    if (data_len > 0) {
        // 源和目标可能重叠，必须用memmove
        std::memmove(data_.data(), data_.data() + read_idx_, data_len);
    }
    read_idx_ = 0;
    write_idx_ = data_len;
}

void Buffer::ensure_writable(size_t len) {
    size_t required = write_idx_ + len;
    if (required <= data_.size()) {
        return;
    }
    size_t new_capacity = std::max(data_.size(), MIN_CAPACITY);
    while (new_capacity < required) {
        new_capacity *= 2;
    }
    data_.resize(new_capacity);
}

} // namespace utils
} // namespace stream_http
