#pragma once

#include "util/curlWrappers.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace pw::usage {

// HTTP seam between the reconciler (and release lookups) and the network.
class Transport {
public:
    virtual ~Transport() = default;

    virtual util::HttpResponse get(const std::string& url,
                                   const std::vector<std::string>& headers,
                                   std::chrono::seconds timeout) = 0;

    virtual util::HttpResponse post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<std::string>& headers,
                                    std::chrono::seconds timeout) = 0;
};

class CurlTransport final : public Transport {
public:
    static constexpr auto USER_AGENT = "proxywatch";

    util::HttpResponse get(const std::string& url,
                           const std::vector<std::string>& headers,
                           std::chrono::seconds timeout) override;

    util::HttpResponse post(const std::string& url,
                            const std::string& body,
                            const std::vector<std::string>& headers,
                            std::chrono::seconds timeout) override;
};

}
