//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace http::transport {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 0L;
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long NO_BODY = 1L;
        static constexpr long POST = 1L;
        static constexpr const char* USER_AGENT = "nero-kitsu/1.0";
        static constexpr const char* DISABLE_EXPECT = "Expect:";
        static constexpr const char* DISABLE_CONTENT_TYPE = "Content-Type:";
        static constexpr const char* CONTENT_TYPE = "Content-Type";
    };

    ErrorCode to_error_code(CURLcode rc, const char* detail) {
        std::string message = (detail != nullptr && detail[0] != '\0') ? std::string(detail) : std::string(curl_easy_strerror(rc));

        auto kind = [rc]() {
            switch (rc) {
                case CURLE_COULDNT_RESOLVE_HOST:
                case CURLE_COULDNT_RESOLVE_PROXY:
                    return ErrorCodeKind::DNS_ERROR;
                case CURLE_COULDNT_CONNECT:
                    return ErrorCodeKind::CONNECTION_REFUSED;
                case CURLE_OPERATION_TIMEDOUT:
                    return ErrorCodeKind::CONNECTION_TIMEOUT;
                case CURLE_GOT_NOTHING:
                case CURLE_RECV_ERROR:
                case CURLE_SEND_ERROR:
                    return ErrorCodeKind::CONNECTION_TERMINATED;
                case CURLE_SSL_CONNECT_ERROR:
                    return ErrorCodeKind::TLS_PROTOCOL_ERROR;
                case CURLE_PEER_FAILED_VERIFICATION:
                case CURLE_SSL_CERTPROBLEM:
                case CURLE_SSL_CACERT_BADFILE:
                    return ErrorCodeKind::TLS_CERTIFICATE_ERROR;
                case CURLE_PARTIAL_FILE:
                    return ErrorCodeKind::HTTP_RESPONSE_INCOMPLETE;
                case CURLE_WEIRD_SERVER_REPLY:
                case CURLE_HTTP2:
                case CURLE_HTTP2_STREAM:
                    return ErrorCodeKind::HTTP_PROTOCOL_ERROR;
                case CURLE_TOO_MANY_REDIRECTS:
                    return ErrorCodeKind::LOOP_DETECTED;
                case CURLE_UNSUPPORTED_PROTOCOL:
                case CURLE_URL_MALFORMAT:
                    return ErrorCodeKind::CONFIGURATION_ERROR;
                default:
                    return ErrorCodeKind::INTERNAL_ERROR;
            }
        }();

        return ErrorCode{.kind_ = kind, .message_ = std::move(message)};
    }

    void CurlUploadBody::blocking_write_and_flush(std::string_view chunk) {
        if (finished_) {
            throw TransportError(ErrorCode{.kind_ = ErrorCodeKind::INTERNAL_ERROR, .message_ = "write after body was finished"});
        }
        buffer_.append(chunk);
    }

    void CurlUploadBody::finish() {
        if (finished_) {
            throw TransportError(ErrorCode{.kind_ = ErrorCodeKind::INTERNAL_ERROR, .message_ = "body already finished"});
        }
        finished_ = true;
    }

    size_t CurlUploadBody::read(char* dst, size_t max_len) {
        const size_t n = std::min(max_len, buffer_.size() - offset_);
        std::memcpy(dst, buffer_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    CurlExchange::CurlExchange(OutgoingRequest req) : req_(std::move(req)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw TransportError(ErrorCode{.kind_ = ErrorCodeKind::INTERNAL_ERROR, .message_ = "Failed to create CURL easy handle"});
        }

        error_buf_[0] = '\0';
    }

    CurlExchange::~CurlExchange() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    OutgoingBody& CurlExchange::body() { return upload_; }

    template <typename T>
    void CurlExchange::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw TransportError(to_error_code(rc, nullptr));
        }
    }

    std::vector<std::string> request_header_lines(const Fields& headers, bool has_body) {
        std::vector<std::string> lines;
        lines.reserve(headers.size() + 2);
        for (const auto& [name, value] : headers.entries()) {
            // "Name:" would make curl drop the header; "Name;" sends it empty.
            lines.push_back(value.empty() ? name + ";" : name + ": " + value);
        }
        if (has_body) {
            lines.emplace_back(CurlDefaults::DISABLE_EXPECT);
            // curl would otherwise add a form-urlencoded Content-Type to a POST.
            if (!headers.has(CurlDefaults::CONTENT_TYPE)) {
                lines.emplace_back(CurlDefaults::DISABLE_CONTENT_TYPE);
            }
        }
        return lines;
    }

    const char* custom_request(Method method, bool has_body) {
        if (has_body) {
            return method == Method::POST ? nullptr : to_string(method);
        }
        if (method == Method::GET || method == Method::HEAD) {
            return nullptr;
        }
        return to_string(method);
    }

    void append_header_line(Fields& headers, std::string_view line) {
        // A new status line starts a new header block (e.g. after 100 Continue).
        if (line.starts_with("HTTP/")) {
            headers = Fields{};
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }

        const std::string name = string_utils::trim(std::string(line.substr(0, colon)));
        const std::string value = string_utils::trim(std::string(line.substr(colon + 1)));
        if (!name.empty()) {
            headers.append_raw(name, value);
        }
    }

    void CurlExchange::set_headers() {
        for (const auto& line : request_header_lines(req_.headers_, upload_.has_data())) {
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlExchange::prepare() {
        const std::string url = req_.scheme_.to_string() + "://" + req_.authority_ + req_.path_with_query_;

        setopt(CURLOPT_URL, url.c_str());
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &response_body_);
        setopt(CURLOPT_HEADERFUNCTION, &CurlExchange::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        if (upload_.has_data()) {
            setopt(CURLOPT_POST, CurlDefaults::POST);
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(upload_.size()));
            setopt(CURLOPT_READFUNCTION, &CurlExchange::read_cb);
            setopt(CURLOPT_READDATA, &upload_);
        } else if (req_.method_ == Method::GET) {
            setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        } else if (req_.method_ == Method::HEAD) {
            setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
        }

        if (const char* verb = custom_request(req_.method_, upload_.has_data()); verb != nullptr) {
            setopt(CURLOPT_CUSTOMREQUEST, verb);
        }

        set_headers();
    }

    size_t CurlExchange::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlExchange*>(userdata);
        const size_t bytes = size * n_items;
        append_header_line(self->response_headers_, std::string_view(buffer, bytes));
        return bytes;
    }

    size_t CurlExchange::read_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* body = static_cast<CurlUploadBody*>(userdata);
        return body->read(buffer, size * n_items);
    }

    void CurlExchange::block() {
        if (performed_) {
            return;
        }
        performed_ = true;

        prepare();
        rc_ = curl_easy_perform(handle_);
    }

    IncomingResponse CurlExchange::get() {
        if (!performed_) {
            throw TransportError(ErrorCode{.kind_ = ErrorCodeKind::INTERNAL_ERROR, .message_ = "response is not ready"});
        }

        if (rc_ != CURLE_OK) {
            throw TransportError(to_error_code(rc_, error_buf_.data()));
        }

        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        IncomingResponse r;
        r.status_ = static_cast<uint16_t>(code);
        r.headers_ = std::move(response_headers_);
        r.body_ = std::make_unique<BufferInputStream>(std::move(response_body_));
        return r;
    }

    std::unique_ptr<IExchange> CurlTransport::handle(OutgoingRequest req) { return std::make_unique<CurlExchange>(std::move(req)); }

}  // namespace http::transport
