//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_CURL_TRANSPORT_HPP
#define NERO_KITSU_CURL_TRANSPORT_HPP

#include <curl/curl.h>

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "interface.hpp"
#include "types.hpp"

struct curl_slist;

namespace http::transport {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    ErrorCode to_error_code(CURLcode rc, const char* detail);

    // Lines handed to CURLOPT_HTTPHEADER. With a body, curl's own Expect and
    // Content-Type defaults are switched off.
    std::vector<std::string> request_header_lines(const Fields& headers, bool has_body);

    // Verb for CURLOPT_CUSTOMREQUEST, or nullptr where curl's default (GET,
    // HEAD, or POST for a request with a body) already matches.
    const char* custom_request(Method method, bool has_body);

    // Folds one raw header line from curl into headers. Status lines reset the
    // block; lines without a colon are skipped.
    void append_header_line(Fields& headers, std::string_view line);

    // Collects the request body until finish(); curl pulls it during perform.
    class CurlUploadBody : public OutgoingBody {
       public:
        void blocking_write_and_flush(std::string_view chunk) override;
        void finish() override;

        [[nodiscard]] bool is_finished() const { return finished_; }
        [[nodiscard]] bool has_data() const { return !buffer_.empty(); }
        [[nodiscard]] size_t size() const { return buffer_.size(); }
        size_t read(char* dst, size_t max_len);

       private:
        std::string buffer_;
        size_t offset_ = 0;
        bool finished_ = false;
    };

    class CurlExchange : public IExchange {
       public:
        explicit CurlExchange(OutgoingRequest req);

        ~CurlExchange() override;
        CurlExchange(const CurlExchange&) = delete;
        CurlExchange& operator=(const CurlExchange&) = delete;
        CurlExchange(CurlExchange&&) = delete;
        CurlExchange& operator=(CurlExchange&&) = delete;

        OutgoingBody& body() override;
        void block() override;
        IncomingResponse get() override;

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void prepare();
        void set_headers();
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t read_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        OutgoingRequest req_;
        CurlUploadBody upload_;

        bool performed_ = false;
        CURLcode rc_ = CURLE_OK;
        Fields response_headers_;
        std::string response_body_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        CURL* handle_{};
    };

    // Host transport backed by one curl easy handle per exchange. curl never
    // follows redirects here and no timeouts are configured.
    class CurlTransport : public IOutgoingHandler {
       public:
        CurlTransport() = default;

        std::unique_ptr<IExchange> handle(OutgoingRequest req) override;
    };
}  // namespace http::transport

#endif
