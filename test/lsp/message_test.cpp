#include "lsp/message.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::FrameParser;
using lsp::MessageKind;

TEST_CASE("EncodeFrame prefixes the byte length", "[message]") {
  REQUIRE(lsp::EncodeFrame("{}") == "Content-Length: 2\r\n\r\n{}");
  // Length counts bytes, not characters
  REQUIRE(lsp::EncodeFrame("\"é\"") == "Content-Length: 4\r\n\r\n\"é\"");
}

TEST_CASE("FrameParser reassembles frames split across reads", "[message]") {
  const std::string frame = lsp::EncodeFrame(R"({"id":1})");
  FrameParser parser;

  parser.Feed(frame.substr(0, 7));
  auto first = parser.Next();
  REQUIRE(first.has_value());
  REQUIRE_FALSE(first->has_value());

  parser.Feed(frame.substr(7, 20));
  parser.Feed(frame.substr(27));
  auto body = parser.Next();
  REQUIRE(body.has_value());
  REQUIRE(body->has_value());
  REQUIRE(**body == R"({"id":1})");
  REQUIRE(parser.BufferedSize() == 0);
}

TEST_CASE("FrameParser yields back-to-back frames in order", "[message]") {
  FrameParser parser;
  parser.Feed(lsp::EncodeFrame("[1]") + lsp::EncodeFrame("[2]"));

  auto first = parser.Next();
  auto second = parser.Next();
  auto third = parser.Next();
  REQUIRE(first.has_value());
  REQUIRE(**first == "[1]");
  REQUIRE(second.has_value());
  REQUIRE(**second == "[2]");
  REQUIRE(third.has_value());
  REQUIRE_FALSE(third->has_value());
}

TEST_CASE("FrameParser ignores other headers", "[message]") {
  FrameParser parser;
  parser.Feed(
      "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
      "content-length: 2\r\n\r\n{}");
  auto body = parser.Next();
  REQUIRE(body.has_value());
  REQUIRE(**body == "{}");
}

TEST_CASE("FrameParser reports missing Content-Length", "[message]") {
  FrameParser parser;
  parser.Feed("Content-Type: text\r\n\r\n" + lsp::EncodeFrame("{}"));

  auto bad = parser.Next();
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().Code() == lsp::error::LspErrorCode::kProtocolError);

  // Parsing resumes at the following header
  auto good = parser.Next();
  REQUIRE(good.has_value());
  REQUIRE(**good == "{}");
}

TEST_CASE("FrameParser rejects a malformed length", "[message]") {
  FrameParser parser;
  parser.Feed("Content-Length: twelve\r\n\r\n");
  auto bad = parser.Next();
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().Code() == lsp::error::LspErrorCode::kProtocolError);
}

TEST_CASE("ClassifyMessage distinguishes message shapes", "[message]") {
  using nlohmann::json;
  REQUIRE(
      lsp::ClassifyMessage(lsp::MakeRequest(3, "initialize", json::object())) ==
      MessageKind::kRequest);
  REQUIRE(
      lsp::ClassifyMessage(lsp::MakeNotification("exit", nullptr)) ==
      MessageKind::kNotification);
  REQUIRE(
      lsp::ClassifyMessage(lsp::MakeResponse(3, nullptr)) ==
      MessageKind::kResponse);
  REQUIRE(
      lsp::ClassifyMessage(lsp::MakeErrorResponse(3, -32601, "nope")) ==
      MessageKind::kResponse);
  REQUIRE(lsp::ClassifyMessage(json::array()) == MessageKind::kInvalid);
  REQUIRE(lsp::ClassifyMessage(json{{"id", 1}}) == MessageKind::kInvalid);
}

TEST_CASE("MakeNotification omits null params", "[message]") {
  auto message = lsp::MakeNotification("exit", nullptr);
  REQUIRE_FALSE(message.contains("params"));
  REQUIRE(message["jsonrpc"] == "2.0");
}
