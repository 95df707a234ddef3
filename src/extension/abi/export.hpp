#ifndef NERO_KITSU_EXTENSION_EXPORT_HPP
#define NERO_KITSU_EXTENSION_EXPORT_HPP

#include <memory>

#include "../../http/transport/curl_global.hpp"
#include "../interface.hpp"
#include "abi.h"

namespace extension::abi {

    // Wraps any IExtension in the C vtable. curl_global is kept alive for as
    // long as the instance exists and may be null.
    ExtensionExport make_export(std::unique_ptr<IExtension> extension, std::unique_ptr<http::transport::CurlGlobal> curl_global = nullptr);

}  // namespace extension::abi

#endif
