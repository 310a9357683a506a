#pragma once

#include <stdexcept>
#include <string>

namespace cw::api {

// Non-2xx response or transport failure. status() is 0 when no HTTP response was received.
class HttpError : public std::runtime_error {
public:
    HttpError(const long status, const std::string& what, std::string body = {})
        : std::runtime_error(what), status_(status), body_(std::move(body)) {}

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] bool isNetworkFailure() const noexcept { return status_ == 0; }

private:
    long status_;
    std::string body_;
};

}
