#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <string>

#include "wire_cpp/response.hpp"
#include "wire_cpp/result.hpp"

namespace wire_cpp {

    /// @brief Read the response body and decode it as JSON into T.
    /// @tparam T Any type nlohmann::json can convert to.
    /// @return The body errors of Response::body_string(), or
    /// BodyDecodeFailed when the body is not JSON of the expected shape.
    template <typename T>
    boost::asio::awaitable<Result<T>> body_json(Response& response) {
        auto body = co_await response.body_string();
        if (body.has_error()) {
            co_return std::move(body).template forward_error<T>();
        }

        auto j = nlohmann::json::parse(body.value(), nullptr, false);
        if (j.is_discarded()) {
            co_return Result<T>::err(Error::Code::BodyDecodeFailed,
                                     "response body is not valid JSON");
        }

        try {
            co_return Result<T>::ok(j.template get<T>());
        } catch (nlohmann::json::exception const& e) {
            co_return Result<T>::err(Error::Code::BodyDecodeFailed,
                                     std::string("JSON conversion failed: ") +
                                         e.what());
        }
    }

}  // namespace wire_cpp
