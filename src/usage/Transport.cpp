#include "usage/Transport.hpp"

using namespace pw::usage;
using namespace pw::util;

namespace {

void applyCommon(CURL* h, const std::string& url, const SList& hdrs, const std::chrono::seconds timeout) {
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, CurlTransport::USER_AGENT);
}

}

HttpResponse CurlTransport::get(const std::string& url,
                                const std::vector<std::string>& headers,
                                const std::chrono::seconds timeout) {
    SList hdrs;
    for (const auto& h : headers) hdrs.add(h);

    return performCurl([&](CURL* h) {
        applyCommon(h, url, hdrs, timeout);
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });
}

HttpResponse CurlTransport::post(const std::string& url,
                                 const std::string& body,
                                 const std::vector<std::string>& headers,
                                 const std::chrono::seconds timeout) {
    SList hdrs;
    for (const auto& h : headers) hdrs.add(h);

    return performCurl([&](CURL* h) {
        applyCommon(h, url, hdrs, timeout);
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    });
}
