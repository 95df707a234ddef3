//
// Created by Daniel Griffiths on 11/1/25.
//

#include "response.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::model {
    const uint64_t MAX_RESERVE_BYTES = 1ULL << 24U;

    Response::Response(uint16_t status_code, http::transport::Fields headers, std::unique_ptr<http::transport::InputStream> body)
        : status_code_(status_code), headers_(std::move(headers)), body_(std::move(body)) {}

    std::optional<uint64_t> Response::content_length() const {
        const auto values = headers_.get(constants::CONTENT_LENGTH);
        if (values.empty()) {
            return std::nullopt;
        }
        return string_utils::parse_u64(string_utils::trim(values.front()));
    }

    std::unique_ptr<http::transport::InputStream> Response::take_body() {
        if (!body_) {
            throw std::logic_error("response body already consumed");
        }
        return std::move(body_);
    }

    std::string Response::bytes() && {
        auto stream = take_body();

        const std::optional<uint64_t> declared = content_length();
        const uint64_t ceiling = declared.value_or(UINT64_MAX);

        std::string full;
        full.reserve(static_cast<size_t>(std::min(declared.value_or(0), MAX_RESERVE_BYTES)));

        uint64_t received = 0;
        while (received < ceiling) {
            auto chunk = stream->blocking_read(ceiling - received);
            if (!chunk) {
                break;
            }
            received += chunk->size();
            full += *chunk;
        }

        return full;
    }

    std::string Response::text() && { return string_utils::utf8_lossy(std::move(*this).bytes()); }

    std::unique_ptr<http::transport::InputStream> Response::input_stream() && { return take_body(); }
}  // namespace http::model
