#pragma once

#include "usage/Transport.hpp"

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace pw::test {

// Scripted transport: answers come from a queue, requests are recorded.
class FakeTransport final : public usage::Transport {
public:
    struct Call {
        std::string method;
        std::string url;
        std::string body;
        std::vector<std::string> headers;
        std::chrono::seconds timeout{};
    };

    std::deque<util::HttpResponse> responses;
    std::vector<Call> calls;

    void respond(const long status, std::string body) {
        util::HttpResponse r;
        r.http = status;
        r.body = std::move(body);
        responses.push_back(std::move(r));
    }

    void failConnect() {
        util::HttpResponse r;
        r.curl = CURLE_COULDNT_CONNECT;
        responses.push_back(std::move(r));
    }

    util::HttpResponse get(const std::string& url, const std::vector<std::string>& headers,
                           const std::chrono::seconds timeout) override {
        calls.push_back({"GET", url, {}, headers, timeout});
        return next();
    }

    util::HttpResponse post(const std::string& url, const std::string& body,
                            const std::vector<std::string>& headers, const std::chrono::seconds timeout) override {
        calls.push_back({"POST", url, body, headers, timeout});
        return next();
    }

private:
    util::HttpResponse next() {
        if (responses.empty()) throw std::runtime_error("no scripted response");
        auto r = std::move(responses.front());
        responses.pop_front();
        return r;
    }
};

}
