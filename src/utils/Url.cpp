#include "Url.hpp"
#include <curl/curl.h>
#include <memory>

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// Returns false when the part is absent (CURLUE_NO_PORT, CURLUE_NO_QUERY, ...)
bool getPart(CURLU* handle, CURLUPart what, std::string& out) {
    char* part = nullptr;
    if (curl_url_get(handle, what, &part, 0) != CURLUE_OK) {
        return false;
    }
    out = part;
    curl_free(part);
    return true;
}

}

std::optional<Url> Url::parse(const std::string& text) {
    UrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle) {
        return std::nullopt;
    }

    if (curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::nullopt;
    }

    Url result;
    result.url = text;
    if (!getPart(handle.get(), CURLUPART_SCHEME, result.scheme) ||
        !getPart(handle.get(), CURLUPART_HOST, result.host)) {
        return std::nullopt;
    }
    if (!getPart(handle.get(), CURLUPART_PATH, result.path)) {
        result.path = "/";
    }

    std::string part;
    if (getPart(handle.get(), CURLUPART_PORT, part)) {
        result.port = part;
    }
    if (getPart(handle.get(), CURLUPART_QUERY, part)) {
        result.query = part;
    }
    return result;
}
