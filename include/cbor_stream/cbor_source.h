#pragma once

#include "cbor_stream/cbor.h"
#include "cbor_stream/cbor_stream_config.h"

#include <algorithm>
#include <cstddef>
#include <istream>
#include <span>
#include <utility>
#include <vector>

namespace cbor::stream {

// Sources hand out what they currently hold through fill(want), trying to hold at least `want` bytes,
// and forget a prefix through consume(n). A short view from fill() means the input ran out.

class span_source {
  public:
    span_source() = default;
    explicit span_source(std::span<const std::byte> data) noexcept : data_(data) {}

    expected<std::span<const std::byte>> fill(std::size_t) const noexcept { return data_; }
    void                                 consume(std::size_t n) noexcept { data_ = data_.subspan(std::min(n, data_.size())); }

  private:
    std::span<const std::byte> data_;
};

class vector_source {
  public:
    vector_source() = default;
    explicit vector_source(std::vector<std::byte> data) noexcept : data_(std::move(data)) {}

    expected<std::span<const std::byte>> fill(std::size_t) const noexcept {
        return std::span<const std::byte>(data_).subspan(position_);
    }
    void consume(std::size_t n) noexcept { position_ += std::min(n, data_.size() - position_); }

    // Hands back the bytes not consumed yet
    std::vector<std::byte> release() && {
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(position_));
        position_ = 0;
        return std::move(data_);
    }

  private:
    std::vector<std::byte> data_;
    std::size_t            position_{0};
};

// Refillable buffer over a blocking stream, reads only what a caller asks for plus what is readily available
class istream_source {
  public:
    explicit istream_source(std::istream &in, std::size_t capacity = CBOR_STREAM_DEFAULT_BUFFER_SIZE)
        : in_(&in), buffer_(std::max<std::size_t>(capacity, minimum_capacity)) {}

    expected<std::span<const std::byte>> fill(std::size_t want) {
        want = std::min(want, buffer_.size());
        if (available() < want && !eof_) {
            compact();

            const auto missing = want - available();
            in_->read(write_pointer(), static_cast<std::streamsize>(missing));
            end_ += static_cast<std::size_t>(in_->gcount());

            if (in_->bad()) {
                return unexpected<decode_error>(decode_error::source_error("stream read failed"));
            }
            if (in_->eof()) {
                eof_ = true;
            } else if (in_->fail()) {
                return unexpected<decode_error>(decode_error::source_error("stream entered fail state"));
            } else if (end_ < buffer_.size()) {
                const auto extra = in_->readsome(write_pointer(), static_cast<std::streamsize>(buffer_.size() - end_));
                end_ += static_cast<std::size_t>(extra);
            }
        }
        return std::span<const std::byte>(buffer_.data() + begin_, available());
    }

    void consume(std::size_t n) noexcept {
        begin_ += std::min(n, available());
        if (begin_ == end_) {
            begin_ = 0;
            end_   = 0;
        }
    }

    std::istream &stream() noexcept { return *in_; }
    std::size_t   capacity() const noexcept { return buffer_.size(); }

  private:
    static constexpr std::size_t minimum_capacity = 16;

    std::size_t available() const noexcept { return end_ - begin_; }
    char       *write_pointer() noexcept { return reinterpret_cast<char *>(buffer_.data() + end_); }

    void compact() noexcept {
        if (begin_ == 0) {
            return;
        }
        std::copy(buffer_.begin() + static_cast<std::ptrdiff_t>(begin_), buffer_.begin() + static_cast<std::ptrdiff_t>(end_),
                  buffer_.begin());
        end_ -= begin_;
        begin_ = 0;
    }

    std::istream          *in_;
    std::vector<std::byte> buffer_;
    std::size_t            begin_{0};
    std::size_t            end_{0};
    bool                   eof_{false};
};

static_assert(ByteSource<span_source>);
static_assert(ByteSource<vector_source>);
static_assert(ByteSource<istream_source>);

} // namespace cbor::stream
