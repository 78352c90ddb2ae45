#ifndef APIWIRE_TRANSPORT_REPLAYABLE_BODY_HPP
#define APIWIRE_TRANSPORT_REPLAYABLE_BODY_HPP

#include <tl/expected.hpp>

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <string_view>

namespace apiwire {

// ─────────────────────────────────────────────────────────────────────────────
// BodyReader
// ─────────────────────────────────────────────────────────────────────────────
// A single-pass cursor over request bytes, handed to the transport for one
// attempt. Readers share the underlying buffer; each has its own offset.

class BodyReader {
public:
    BodyReader() = default;

    explicit BodyReader(std::shared_ptr<const std::string> bytes)
        : bytes_(std::move(bytes))
    {}

    /// False when the request has no body at all (as opposed to an empty one).
    [[nodiscard]] bool has_body() const noexcept {
        return bytes_ != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return has_body() ? bytes_->size() : 0;
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return size() - offset_;
    }

    /// Copy up to `count` bytes into `dest`; returns how many were copied.
    std::size_t read(char* dest, std::size_t count);

    /// Everything not read yet. The reader is drained afterwards.
    [[nodiscard]] std::string read_all();

private:
    std::shared_ptr<const std::string> bytes_;
    std::size_t offset_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// ReplayableBody
// ─────────────────────────────────────────────────────────────────────────────
// Request bytes captured once when the request is built. open() re-exposes
// them as a fresh reader for every send attempt, so a retry transmits exactly
// what the first attempt did even if the original source was a one-shot
// stream.

class ReplayableBody {
public:
    /// No body
    ReplayableBody() = default;

    [[nodiscard]] static ReplayableBody from_bytes(std::string bytes);

    /// Drain `source` once. Fails if the stream reports an error.
    [[nodiscard]] static tl::expected<ReplayableBody, std::string> capture(std::istream& source);

    [[nodiscard]] bool has_body() const noexcept {
        return bytes_ != nullptr;
    }

    [[nodiscard]] std::string_view bytes() const noexcept {
        return has_body() ? std::string_view(*bytes_) : std::string_view{};
    }

    /// Fresh reader positioned at the first byte; counts one attempt.
    [[nodiscard]] BodyReader open();

    /// Number of times open() was called.
    [[nodiscard]] std::size_t attempts() const noexcept {
        return attempts_;
    }

private:
    explicit ReplayableBody(std::shared_ptr<const std::string> bytes)
        : bytes_(std::move(bytes))
    {}

    std::shared_ptr<const std::string> bytes_;
    std::size_t attempts_{0};
};

}  // namespace apiwire

#endif  // APIWIRE_TRANSPORT_REPLAYABLE_BODY_HPP
