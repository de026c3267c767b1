// stubs/notify_stub.cpp
// Prints every transition datagram the watcher sends.
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

static uint16_t get_port() {
  const char* p = std::getenv("NOTIFY_PORT");
  return p ? static_cast<uint16_t>(std::stoi(p)) : 19000;
}

int main() {
  const uint16_t port = get_port();

  int s = socket(AF_INET, SOCK_DGRAM, 0);
  if (s < 0) { perror("socket"); return 1; }
  sockaddr_in addr{}; addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = inet_addr("127.0.0.1");
  if (bind(s, (sockaddr*)&addr, sizeof(addr)) < 0) { perror("bind"); close(s); return 1; }

  std::cout << "notify_stub listening on 127.0.0.1:" << port << "\n";

  char buf[4096];
  while (true) {
    ssize_t n = recvfrom(s, buf, sizeof(buf), 0, nullptr, nullptr);
    if (n < 0) { perror("recvfrom"); break; }

    const auto msg = nlohmann::json::parse(std::string(buf, static_cast<size_t>(n)), nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
      std::cout << "[raw] " << std::string(buf, static_cast<size_t>(n)) << "\n";
      continue;
    }
    auto where = [&msg](const char* key) {
      auto it = msg.find(key);
      return (it != msg.end() && it->is_string()) ? it->get<std::string>() : std::string("offline");
    };
    std::cout << "[" << msg.value("kind", "?") << "] "
              << msg.value("displayName", "?") << " (" << msg.value("entityId", "?") << "): "
              << where("previous") << " -> " << where("current");
    if (msg.contains("worldName")) std::cout << " @ " << msg.value("worldName", "");
    std::cout << std::endl;
  }
  close(s);
  return 0;
}
