#include "minitest.hpp"
#include "fakes.hpp"
#include "language_server_api.hpp"

using namespace lsquota;
using namespace testing_fakes;

static std::string header_value(const HttpHeaders& headers, const std::string& name) {
  for (const auto& h : headers) if (h.first == name) return h.second;
  return "<missing>";
}

TEST(api_builds_service_url) {
  ASSERT_EQ(service_url(4242, "GetUserStatus"),
            std::string("https://127.0.0.1:4242/exa.language_server_pb.LanguageServerService/GetUserStatus"));
}

TEST(api_probe_sends_auth_headers_and_wrapper_body) {
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(5000);
  FakeHttpClient client(server);
  PortProbe probe(client);

  ASSERT_TRUE(probe.probe(5000, "tok-1"));
  ASSERT_EQ(server->calls.size(), 1u);
  const auto& call = server->calls[0];
  ASSERT_EQ(method_of(call.url), std::string("GetUnleashData"));
  ASSERT_EQ(header_value(call.headers, "Content-Type"), std::string("application/json"));
  ASSERT_EQ(header_value(call.headers, "Connect-Protocol-Version"), std::string("1"));
  ASSERT_EQ(header_value(call.headers, "X-Codeium-Csrf-Token"), std::string("tok-1"));

  Json::Value body; std::string errs;
  ASSERT_TRUE(parse_json(call.body, body, errs));
  ASSERT_TRUE(body["wrapper_data"].isObject());
  ASSERT_TRUE(body["wrapper_data"].empty());
}

TEST(api_probe_is_false_for_unreachable_port) {
  auto server = std::make_shared<FakeServer>();
  FakeHttpClient client(server);
  PortProbe probe(client);
  ASSERT_FALSE(probe.probe(1, "tok"));
}

TEST(api_probe_is_false_for_non_200) {
  auto server = std::make_shared<FakeServer>();
  server->handler = [](const std::string&, const std::string&) { return HttpResponse{"{}", 404}; };
  FakeHttpClient client(server);
  PortProbe probe(client);
  ASSERT_FALSE(probe.probe(2, "tok"));
}

TEST(api_probe_is_false_for_malformed_body) {
  auto server = std::make_shared<FakeServer>();
  server->handler = [](const std::string&, const std::string&) { return ok("<html>not json</html>"); };
  FakeHttpClient client(server);
  PortProbe probe(client);
  ASSERT_FALSE(probe.probe(3, "tok"));

  server->handler = [](const std::string&, const std::string&) { return ok("{\"a\":1} trailing"); };
  ASSERT_FALSE(probe.probe(3, "tok"));
}

TEST(api_probe_swallows_unexpected_exceptions) {
  auto server = std::make_shared<FakeServer>();
  server->handler = [](const std::string&, const std::string&) -> HttpResponse {
    throw std::runtime_error("boom");
  };
  FakeHttpClient client(server);
  PortProbe probe(client);
  ASSERT_FALSE(probe.probe(4, "tok"));
}

TEST(api_fetch_sends_metadata) {
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(6000, "{\"userStatus\":{\"name\":\"Ada\"}}");
  FakeHttpClient client(server);
  Connection conn; conn.port = 6000; conn.csrf_token = "secret";

  auto raw = QuotaFetcher(client).fetch(conn);
  ASSERT_EQ(raw["userStatus"]["name"].asString(), std::string("Ada"));

  const auto& call = server->calls.back();
  ASSERT_EQ(method_of(call.url), std::string("GetUserStatus"));
  ASSERT_EQ(header_value(call.headers, "X-Codeium-Csrf-Token"), std::string("secret"));
  Json::Value body; std::string errs;
  ASSERT_TRUE(parse_json(call.body, body, errs));
  ASSERT_EQ(body["metadata"]["ideName"].asString(), std::string("antigravity"));
  ASSERT_EQ(body["metadata"]["extensionName"].asString(), std::string("antigravity"));
  ASSERT_EQ(body["metadata"]["locale"].asString(), std::string("en"));
}

TEST(api_fetch_transport_error_is_remote_error) {
  auto server = std::make_shared<FakeServer>();
  FakeHttpClient client(server);
  Connection conn; conn.port = 1;
  ASSERT_THROWS(QuotaFetcher(client).fetch(conn), RemoteException);
}

TEST(api_fetch_http_error_is_remote_error) {
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(7000, "{}", 401);
  FakeHttpClient client(server);
  Connection conn; conn.port = 7000;
  try {
    QuotaFetcher(client).fetch(conn);
    throw mini::AssertionError("expected RemoteException");
  } catch (const RemoteException& e) {
    ASSERT_TRUE(e.kind() == ErrorKind::RemoteError);
    ASSERT_EQ(std::string(e.what()), std::string("HTTP error: 401"));
  }
}

TEST(api_fetch_malformed_body_is_malformed_upstream) {
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(7001, "[1,2,3]");
  FakeHttpClient client(server);
  Connection conn; conn.port = 7001;
  try {
    QuotaFetcher(client).fetch(conn);
    throw mini::AssertionError("expected MalformedResponseException");
  } catch (const MalformedResponseException& e) {
    ASSERT_TRUE(e.kind() == ErrorKind::MalformedUpstream);
  }

  server->handler = language_server(7001, "not json");
  ASSERT_THROWS(QuotaFetcher(client).fetch(conn), RemoteException);
}
