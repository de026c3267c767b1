#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string>
#include <nlohmann/json.hpp>
#include "diag/status_server.hpp"

using namespace presence;
using nlohmann::json;

namespace {

diag::HealthSnapshot Connected() {
  diag::HealthSnapshot s;
  s.connection_state = "connected";
  s.healthy = true;
  s.last_event = core::WallClock::time_point(std::chrono::seconds(1714564800));
  s.attempts = 0;
  s.entities = 2;
  return s;
}

std::string HttpGet(std::uint16_t port, const std::string& request) {
  int s = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{}; addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) { ::close(s); return {}; }
  ::write(s, request.data(), request.size());
  std::string out;
  char buf[1024];
  ssize_t n;
  while ((n = ::read(s, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
  ::close(s);
  return out;
}

} // namespace

TEST(StatusServer, HealthyWhenConnected) {
  diag::StatusServer server(Connected);

  auto reply = server.Handle("GET /health HTTP/1.1");

  EXPECT_EQ(reply.status, 200);
  EXPECT_EQ(reply.content_type, "application/json");
  const json body = json::parse(reply.body);
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["connectionState"], "connected");
  EXPECT_EQ(body["lastEventTime"], "2024-05-01T12:00:00.000Z");
  EXPECT_EQ(body["attempts"], 0);
  EXPECT_EQ(body["entities"], 2);
  EXPECT_TRUE(body["timestamp"].is_string());
}

TEST(StatusServer, UnhealthyWhileReconnecting) {
  diag::StatusServer server([] {
    diag::HealthSnapshot s;
    s.connection_state = "reconnecting";
    s.attempts = 4;
    return s;
  });

  auto reply = server.Handle("GET /health HTTP/1.1");

  EXPECT_EQ(reply.status, 503);
  const json body = json::parse(reply.body);
  EXPECT_EQ(body["status"], "unhealthy");
  EXPECT_EQ(body["connectionState"], "reconnecting");
  EXPECT_TRUE(body["lastEventTime"].is_null());
  EXPECT_EQ(body["attempts"], 4);
}

TEST(StatusServer, OtherRequests) {
  diag::StatusServer server(Connected);
  EXPECT_EQ(server.Handle("GET / HTTP/1.1").status, 404);
  EXPECT_EQ(server.Handle("GET /metrics HTTP/1.1").status, 404);
  EXPECT_EQ(server.Handle("POST /health HTTP/1.1").status, 405);
  EXPECT_EQ(server.Handle("").status, 400);
}

TEST(StatusServer, ServesOverTcp) {
  diag::StatusServer server(Connected);
  auto started = server.Start("127.0.0.1", 0);
  ASSERT_TRUE(started.HasValue()) << started.Error().Describe();
  ASSERT_NE(server.Port(), 0);

  const auto ok = HttpGet(server.Port(), "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(ok.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << ok;
  EXPECT_NE(ok.find("\"healthy\""), std::string::npos);

  const auto missing = HttpGet(server.Port(), "GET /nope HTTP/1.1\r\n\r\n");
  EXPECT_EQ(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << missing;

  server.Stop();
  server.Stop();
}

TEST(StatusServer, BadBindAddressIsReported) {
  diag::StatusServer server(Connected);
  auto r = server.Start("not-an-address", 0);
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kInvalidArgument);
}
