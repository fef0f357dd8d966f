#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "wire_cpp/client.hpp"
#include "wire_cpp/serialize_nlohmann.hpp"

using namespace wire_cpp;
using namespace wire_cpp::test;
using namespace std::chrono_literals;

namespace {

    struct Product {
        int id{};
        std::string name;
        std::vector<std::string> tags;
    };

    void from_json(nlohmann::json const& j, Product& p) {
        j.at("id").get_to(p.id);
        j.at("name").get_to(p.name);
        if (j.contains("tags")) j.at("tags").get_to(p.tags);
    }

    std::string json_response(std::string const& body) {
        return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
               "Content-Length: " +
               std::to_string(body.size()) + "\r\n\r\n" + body;
    }

    template <typename T>
    Result<T> fetch_json(IoThreadRunner& runner, Client& c,
                         std::string const& url) {
        return await_or_abort(runner.ioc(),
                              [&]() -> net::awaitable<Result<T>> {
                                  auto resp = co_await c.get(url);
                                  if (resp.has_error()) {
                                      co_return std::move(resp)
                                          .template forward_error<T>();
                                  }
                                  co_return co_await body_json<T>(
                                      resp.value());
                              });
    }

}  // namespace

TEST(JsonBodyTest, DecodesIntoUserType) {
    ScriptedServer srv(keep_alive_responder(json_response(
        R"({"id": 7, "name": "widget", "tags": ["a", "b"]})")));
    IoThreadRunner runner;
    Client c(runner.executor());

    auto p = fetch_json<Product>(runner, c, srv.url("/products/7"));
    ASSERT_TRUE(p.has_value()) << p.error().message;
    EXPECT_EQ(p.value().id, 7);
    EXPECT_EQ(p.value().name, "widget");
    EXPECT_EQ(p.value().tags, (std::vector<std::string>{"a", "b"}));
}

TEST(JsonBodyTest, InvalidJsonIsDecodeError) {
    ScriptedServer srv(keep_alive_responder(json_response("{not json")));
    IoThreadRunner runner;
    Client c(runner.executor());

    auto p = fetch_json<Product>(runner, c, srv.url("/"));
    ASSERT_TRUE(p.has_error());
    EXPECT_EQ(p.error().code, Error::Code::BodyDecodeFailed);
}

TEST(JsonBodyTest, WrongShapeIsDecodeError) {
    ScriptedServer srv(keep_alive_responder(json_response(R"({"id": "x"})")));
    IoThreadRunner runner;
    Client c(runner.executor());

    auto p = fetch_json<Product>(runner, c, srv.url("/"));
    ASSERT_TRUE(p.has_error());
    EXPECT_EQ(p.error().code, Error::Code::BodyDecodeFailed);
}

TEST(JsonBodyTest, RawJsonValue) {
    ScriptedServer srv(keep_alive_responder(json_response("[1,2,3]")));
    IoThreadRunner runner;
    Client c(runner.executor());

    auto j = fetch_json<nlohmann::json>(runner, c, srv.url("/"));
    ASSERT_TRUE(j.has_value()) << j.error().message;
    EXPECT_EQ(j.value().size(), 3u);
}
