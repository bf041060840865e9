// In-memory stand-ins for the OS process table and the HTTP transport
#pragma once
#include "http_client.hpp"
#include "language_server_api.hpp"
#include "process_table.hpp"

#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace testing_fakes {

using lsquota::HttpHeaders;
using lsquota::HttpResponse;

struct RecordedCall { std::string url; std::string body; HttpHeaders headers; };

// Shared by every FakeHttpClient built from the same factory
struct FakeServer {
  // Unset means every request fails at the transport level
  std::function<HttpResponse(const std::string& url, const std::string& body)> handler;
  std::vector<RecordedCall> calls;
  int clients_created = 0;
  int clients_closed = 0;
};

class FakeHttpClient : public lsquota::HttpClient {
public:
  explicit FakeHttpClient(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

  HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) override {
    server_->calls.push_back({url, body, headers});
    if (!server_->handler) throw lsquota::HttpException("CURL error: Couldn't connect to server");
    return server_->handler(url, body);
  }

  void close() override { ++server_->clients_closed; }

private:
  std::shared_ptr<FakeServer> server_;
};

inline lsquota::HttpClientFactory fake_factory(std::shared_ptr<FakeServer> server) {
  return [server]() -> std::unique_ptr<lsquota::HttpClient> {
    ++server->clients_created;
    return std::make_unique<FakeHttpClient>(server);
  };
}

// "https://127.0.0.1:4242/svc/Method" -> 4242
inline int port_of(const std::string& url) {
  auto host = url.find("127.0.0.1:");
  if (host == std::string::npos) return -1;
  return std::atoi(url.c_str() + host + 10);
}

// "https://127.0.0.1:4242/svc/Method" -> "Method"
inline std::string method_of(const std::string& url) {
  return url.substr(url.rfind('/') + 1);
}

inline int count_calls(const FakeServer& server, const std::string& method) {
  int n = 0;
  for (const auto& c : server.calls) if (method_of(c.url) == method) ++n;
  return n;
}

inline HttpResponse ok(const std::string& body) { return HttpResponse{body, 200}; }

// Language Server answering on api_port: probes succeed there, GetUserStatus
// returns status_body with status_code. Other ports refuse connections.
inline std::function<HttpResponse(const std::string&, const std::string&)>
language_server(int api_port, std::string status_body = "{}", long status_code = 200) {
  return [=](const std::string& url, const std::string&) -> HttpResponse {
    if (port_of(url) != api_port) throw lsquota::HttpException("CURL error: Couldn't connect to server");
    if (method_of(url) == "GetUnleashData") return ok("{}");
    return HttpResponse{status_body, status_code};
  };
}

class FakeProcessTable : public lsquota::ProcessTable {
public:
  std::vector<lsquota::ProcessEntry> processes;
  std::map<int, lsquota::ListeningPorts> sockets;
  int list_calls = 0;

  void add(int pid, const std::string& name, std::vector<std::string> args, std::vector<int> ports) {
    processes.push_back({pid, name, std::move(args)});
    lsquota::ListeningPorts lp; lp.ports = std::move(ports);
    sockets[pid] = lp;
  }

  void deny(int pid, lsquota::ProcessError error) {
    lsquota::ListeningPorts lp; lp.error = error;
    sockets[pid] = lp;
  }

  std::vector<lsquota::ProcessEntry> list_processes() override { ++list_calls; return processes; }

  lsquota::ListeningPorts listening_ports(int pid) override {
    auto it = sockets.find(pid);
    if (it == sockets.end()) { lsquota::ListeningPorts lp; lp.error = lsquota::ProcessError::NoSuchProcess; return lp; }
    return it->second;
  }
};

inline std::vector<std::string> ls_args(const std::string& token, int ext_port) {
  return {"/opt/antigravity/bin/language_server_linux_x64", "--enable_lsp",
          "--extension_server_port=" + std::to_string(ext_port), "--csrf_token", token};
}

} // namespace testing_fakes
