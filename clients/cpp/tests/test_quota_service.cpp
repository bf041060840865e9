#include "minitest.hpp"
#include "fakes.hpp"
#include "quota_service.hpp"

using namespace lsquota;
using namespace testing_fakes;

static const char* kName = "language_server_linux";

static const char* kStatus = R"({"userStatus":{"name":"Ada","email":"ada@example.com",
  "planStatus":{"planInfo":{"planName":"Pro","monthlyPromptCredits":100},"availablePromptCredits":25},
  "cascadeModelConfigData":{"clientModelConfigs":[
    {"label":"Claude Sonnet","modelOrAlias":{"model":"M1"},"quotaInfo":{"remainingFraction":0.5,"resetTime":"2026-01-01T01:00:00Z"}}]}}})";

static TimePoint fixed_now() { return *parse_iso8601("2026-01-01T00:00:00Z"); }

TEST(service_returns_report_on_success) {
  FakeProcessTable table;
  table.add(77, "language_server", ls_args("tok", 0), {9000});
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(9000, kStatus);
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  auto report = service.get_quota_report();
  ASSERT_EQ(report.user_name, std::string("Ada"));
  ASSERT_EQ(report.plan_name, std::string("Pro"));
  ASSERT_EQ(report.prompt_credits->used_percentage, 75.0);
  ASSERT_EQ(report.models.size(), 1u);
  ASSERT_EQ(report.models[0].time_until_reset_ms, 3600000);
  ASSERT_EQ(report.timestamp, std::string("2026-01-01T00:00:00+00:00"));

  // second call reuses the connection
  service.get_quota_report();
  ASSERT_EQ(table.list_calls, 1);
  ASSERT_EQ(count_calls(*server, "GetUnleashData"), 1);
  ASSERT_EQ(count_calls(*server, "GetUserStatus"), 2);
}

TEST(service_not_found_without_process) {
  FakeProcessTable table;
  auto server = std::make_shared<FakeServer>();
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  try {
    service.get_quota_report();
    throw mini::AssertionError("expected LanguageServerNotFoundException");
  } catch (const LanguageServerNotFoundException& e) {
    ASSERT_TRUE(e.kind() == ErrorKind::NotFound);
  }
  // no retry for NotFound
  ASSERT_EQ(table.list_calls, 1);
}

TEST(service_retries_once_after_fetch_failure) {
  FakeProcessTable table;
  table.add(1, "language_server", ls_args("old", 0), {9100});
  auto server = std::make_shared<FakeServer>();
  int status_calls = 0;
  server->handler = [&](const std::string& url, const std::string&) -> HttpResponse {
    if (method_of(url) == "GetUnleashData") return ok("{}");
    // the first status call fails, e.g. the server restarted
    if (++status_calls == 1) return HttpResponse{"", 502};
    return ok(kStatus);
  };
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  ASSERT_TRUE(cache.get().has_value());
  // the process restarted on a new port with a new token
  table.processes.clear();
  table.add(2, "language_server", ls_args("new", 0), {9200});

  auto report = service.get_quota_report();
  ASSERT_EQ(report.user_name, std::string("Ada"));
  ASSERT_EQ(server->clients_closed, 1);
  ASSERT_EQ(server->clients_created, 2);

  auto conn = cache.get();
  ASSERT_TRUE(conn.has_value());
  ASSERT_EQ(conn->pid, 2);
  ASSERT_EQ(conn->port, 9200);
  ASSERT_EQ(conn->csrf_token, std::string("new"));
}

TEST(service_gives_up_after_second_failure) {
  FakeProcessTable table;
  table.add(3, "language_server", ls_args("tok", 0), {9300});
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(9300, "{}", 500);
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  try {
    service.get_quota_report();
    throw mini::AssertionError("expected RemoteException");
  } catch (const RemoteException& e) {
    ASSERT_TRUE(e.kind() == ErrorKind::RemoteError);
    ASSERT_EQ(std::string(e.what()), std::string("Quota fetch failed: HTTP error: 500"));
  }
  ASSERT_EQ(count_calls(*server, "GetUserStatus"), 2);
  ASSERT_FALSE(cache.has_connection());

  // next call detects from scratch
  int scans = table.list_calls;
  ASSERT_THROWS(service.get_quota_report(), RemoteException);
  ASSERT_EQ(table.list_calls, scans + 2);
}

TEST(service_malformed_body_takes_retry_path) {
  FakeProcessTable table;
  table.add(4, "language_server", ls_args("tok", 0), {9400});
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(9400, "[]");
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  try {
    service.get_quota_report();
    throw mini::AssertionError("expected RemoteException");
  } catch (const RemoteException& e) {
    // surfaced as a remote error after the retry
    ASSERT_TRUE(e.kind() == ErrorKind::RemoteError);
  }
  ASSERT_EQ(count_calls(*server, "GetUserStatus"), 2);
}

TEST(service_reports_first_cause_when_redetection_finds_nothing) {
  FakeProcessTable table;
  table.add(5, "language_server", ls_args("tok", 0), {9500});
  auto server = std::make_shared<FakeServer>();
  server->handler = [&](const std::string& url, const std::string&) -> HttpResponse {
    if (method_of(url) == "GetUnleashData") return ok("{}");
    table.processes.clear(); // process exits mid-request
    return HttpResponse{"", 503};
  };
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  try {
    service.get_quota_report();
    throw mini::AssertionError("expected RemoteException");
  } catch (const RemoteException& e) {
    ASSERT_EQ(std::string(e.what()), std::string("Quota fetch failed: HTTP error: 503"));
  }
  ASSERT_EQ(count_calls(*server, "GetUserStatus"), 1);
  ASSERT_FALSE(cache.has_connection());
}

TEST(service_invalidate_forces_redetection) {
  FakeProcessTable table;
  table.add(6, "language_server", ls_args("tok", 0), {9600});
  auto server = std::make_shared<FakeServer>();
  server->handler = language_server(9600, kStatus);
  ConnectionCache cache(table, fake_factory(server), kName);
  QuotaService service(cache, fixed_now);

  service.get_quota_report();
  service.invalidate_connection();
  ASSERT_FALSE(cache.has_connection());
  service.get_quota_report();
  ASSERT_EQ(table.list_calls, 2);
  ASSERT_EQ(count_calls(*server, "GetUnleashData"), 2);
}

TEST(service_error_kind_names) {
  ASSERT_EQ(std::string(to_string(ErrorKind::NotFound)), std::string("NotFound"));
  ASSERT_EQ(std::string(to_string(ErrorKind::RemoteError)), std::string("RemoteError"));
  ASSERT_EQ(std::string(to_string(ErrorKind::MalformedUpstream)), std::string("MalformedUpstream"));
}
