// NOLINTBEGIN(modernize-deprecated-headers, cppcoreguidelines-macro-usage, modernize-use-using)

#pragma once
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define EXTENSION_API_VERSION 1

typedef enum CErrorCodeKind {
    ERROR_CODE_NONE = -1,  // success results only
    ERROR_CODE_DNS_TIMEOUT = 0,
    ERROR_CODE_DNS_ERROR = 1,
    ERROR_CODE_DESTINATION_NOT_FOUND = 2,
    ERROR_CODE_DESTINATION_UNAVAILABLE = 3,
    ERROR_CODE_DESTINATION_IP_UNROUTABLE = 4,
    ERROR_CODE_CONNECTION_REFUSED = 5,
    ERROR_CODE_CONNECTION_TERMINATED = 6,
    ERROR_CODE_CONNECTION_TIMEOUT = 7,
    ERROR_CODE_CONNECTION_READ_TIMEOUT = 8,
    ERROR_CODE_CONNECTION_WRITE_TIMEOUT = 9,
    ERROR_CODE_TLS_PROTOCOL_ERROR = 10,
    ERROR_CODE_TLS_CERTIFICATE_ERROR = 11,
    ERROR_CODE_HTTP_REQUEST_DENIED = 12,
    ERROR_CODE_HTTP_REQUEST_BODY_SIZE = 13,
    ERROR_CODE_HTTP_RESPONSE_INCOMPLETE = 14,
    ERROR_CODE_HTTP_PROTOCOL_ERROR = 15,
    ERROR_CODE_HTTP_RESPONSE_TIMEOUT = 16,
    ERROR_CODE_LOOP_DETECTED = 17,
    ERROR_CODE_CONFIGURATION_ERROR = 18,
    ERROR_CODE_INTERNAL_ERROR = 19,
} CErrorCodeKind;

typedef struct CErrorCode {
    CErrorCodeKind kind_;
    const char* message_;  // nullable
} CErrorCode;

typedef struct CHeader {
    const char* name_;
    const char* value_;  // raw bytes, not NUL terminated
    size_t value_len_;
} CHeader;

typedef struct COutgoingRequest {
    const char* method_;
    const char* scheme_;
    const char* authority_;
    const char* path_with_query_;
    const CHeader* headers_;
    size_t headers_count_;
} COutgoingRequest;

// Optional fields are null pointers when absent.
typedef struct CSeries {
    const char* id_;
    const char* title_;
    const COutgoingRequest* poster_resource_;
    const char* synopsis_;
    const char* type_;
} CSeries;

typedef struct CEpisode {
    const char* id_;
    uint16_t number_;
    const char* title_;
    const char* description_;
    const COutgoingRequest* thumbnail_resource_;
} CEpisode;

typedef struct CSeriesPage {
    const CSeries* series_;
    size_t series_count_;
    bool has_next_page_;
} CSeriesPage;

typedef struct CEpisodesPage {
    const CEpisode* episodes_;
    size_t episodes_count_;
    bool has_next_page_;
} CEpisodesPage;

typedef struct CVideo {
    COutgoingRequest video_resource_;
    const char* server_name_;
    int32_t width_;   // -1 when unknown
    int32_t height_;  // -1 when unknown
} CVideo;

typedef struct CFilter {
    const char* id_;
    const char* display_name_;
} CFilter;

typedef struct CFilterCategory {
    const char* id_;
    const char* display_name_;
    const CFilter* filters_;
    size_t filters_count_;
} CFilterCategory;

typedef struct CSearchFilter {
    const char* id_;
    const char* const* values_;
    size_t values_count_;
} CSearchFilter;

typedef struct HostContext {
    int api_version_;
    const char* base_url_;  // nullable, overrides the default endpoint
    uint16_t page_limit_;   // 0 keeps the default
} HostContext;

// NOLINTBEGIN(readability-identifier-naming)
typedef struct ExtensionResult {
    int32_t code_;      // 0 == OK
    CErrorCode error_;  // {ERROR_CODE_NONE, NULL} when code_ == 0 (owned by extension, valid until next call)
} ExtensionResult;

// Every out parameter points into storage owned by the extension instance and
// stays valid until the next call on that instance.
typedef struct ExtensionVTable {
    void (*destroy)(void* self);

    ExtensionResult (*filters)(void* self, const CFilterCategory** out, size_t* out_count);

    ExtensionResult (*search)(void* self, const char* query, const uint16_t* page, const CSearchFilter* filters, size_t filters_count,
                              CSeriesPage* out);

    ExtensionResult (*get_series_info)(void* self, const char* series_id, CSeries* out);

    ExtensionResult (*get_series_episodes)(void* self, const char* series_id, const uint16_t* page, CEpisodesPage* out);

    ExtensionResult (*get_series_videos)(void* self, const char* series_id, const char* episode_id, const CVideo** out, size_t* out_count);
} ExtensionVTable;
// NOLINTEND(readability-identifier-naming)

// ---- Factory export every extension must provide
typedef struct ExtensionExport {
    int api_version_;         // must equal EXTENSION_API_VERSION
    void* instance_;          // opaque pointer to extension state
    ExtensionVTable vtable_;  // function pointers
} ExtensionExport;

#define EXTENSION_CREATE_SYMBOL "create_extension"
typedef ExtensionExport (*CreateExtensionFn)(const HostContext* ctx);

ExtensionExport create_extension(const HostContext* ctx);

#ifdef __cplusplus
}
#endif

// NOLINTEND(modernize-deprecated-headers, cppcoreguidelines-macro-usage, modernize-use-using)
