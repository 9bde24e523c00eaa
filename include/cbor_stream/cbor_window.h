#pragma once

#include "cbor_stream/cbor.h"

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>

namespace cbor::stream {

// Look-ahead over a ByteSource. Offsets returned by peek() are relative to the read position and stop
// meaning anything after consume().
template <ByteSource Source> class byte_window {
  public:
    using source_type = Source;

    explicit byte_window(Source source) : source_(std::move(source)) {}

    expected<std::byte> peek(std::size_t offset) {
        auto view = source_.fill(offset + 1);
        if (!view) {
            return unexpected<decode_error>(view.error());
        }
        if (view->size() <= offset) {
            return unexpected<decode_error>(decode_error::insufficient_data(view->size(), offset));
        }
        return (*view)[offset];
    }

    void consume(std::size_t n) { source_.consume(n); }

    // Moves exactly n bytes into sink(span) in source sized pieces, fails if the input ends first
    template <typename Sink> expected<void> read_exact(std::uint64_t n, Sink &&sink) {
        std::uint64_t done = 0;
        while (done < n) {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(n - done, max_chunk));
            auto       view = source_.fill(want);
            if (!view) {
                return unexpected<decode_error>(view.error());
            }
            if (view->empty()) {
                return unexpected<decode_error>(decode_error::insufficient_data(done, n));
            }
            const auto take = std::min(view->size(), want);
            sink(view->first(take));
            source_.consume(take);
            done += take;
        }
        return {};
    }

    expected<bool> exhausted() {
        auto view = source_.fill(1);
        if (!view) {
            return unexpected<decode_error>(view.error());
        }
        return view->empty();
    }

    Source       &source() noexcept { return source_; }
    const Source &source() const noexcept { return source_; }
    Source        release() && { return std::move(source_); }

  private:
    static constexpr std::uint64_t max_chunk = 64 * 1024;

    Source source_;
};

} // namespace cbor::stream
