#include "apiwire/transport/replayable_body.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace apiwire {

std::size_t BodyReader::read(char* dest, std::size_t count) {
    const std::size_t n = std::min(count, remaining());
    if (n == 0) {
        return 0;
    }
    std::copy_n(bytes_->data() + offset_, n, dest);
    offset_ += n;
    return n;
}

std::string BodyReader::read_all() {
    if (!has_body()) {
        return {};
    }
    std::string rest = bytes_->substr(offset_);
    offset_ = bytes_->size();
    return rest;
}

ReplayableBody ReplayableBody::from_bytes(std::string bytes) {
    return ReplayableBody(std::make_shared<const std::string>(std::move(bytes)));
}

tl::expected<ReplayableBody, std::string> ReplayableBody::capture(std::istream& source) {
    if (source.fail()) {
        return tl::unexpected(std::string("Request body stream is not readable"));
    }

    std::ostringstream buffer;
    // An empty source sets failbit on `buffer`; only badbit is a read error.
    buffer << source.rdbuf();
    if (buffer.bad()) {
        return tl::unexpected(std::string("Failed to read request body stream"));
    }
    return from_bytes(std::move(buffer).str());
}

BodyReader ReplayableBody::open() {
    ++attempts_;
    return BodyReader(bytes_);
}

}  // namespace apiwire
