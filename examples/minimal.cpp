#include <portico/portico.hpp>

#include <pthread.h>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

using namespace portico;

// Configuration is read from the HTTP_SERVER_* environment variables. The optional first argument overrides the
// port. Example:
//   HTTP_SERVER_TLS_MODE=off ./portico-minimal 8080
int main(int argc, char **argv) {
  uint16_t port = 0;
  const bool portOverride = argc > 1;
  if (portOverride) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  // Blocked in all threads (spawned threads inherit the mask), consumed by sigwait below.
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

  try {
    Server server(ServerOptions{}
                      .withConfigProvider([portOverride, port] {
                        ServerConfig config = ServerConfig::FromEnv();
                        if (portOverride) {
                          config.withPort(port);
                        }
                        return config;
                      })
                      .withBoundCallback([](const SocketAddress &address) {
                        std::cout << "Listening on " << address.toString() << '\n';
                      })
                      .withEndpoints([](RouteTableBuilder &builder) {
                        builder.registerEndpoint("/", http::Method::GET,
                                                 [](const HttpRequest &) { return HttpResponse().body("PONG"); });
                        builder.registerEndpoint("/hello/{name}", http::Method::GET, [](const HttpRequest &req) {
                          std::string body("Hello ");
                          body.append(req.pathParam("name").value_or("stranger"));
                          body.append("! Method: ");
                          body.append(http::MethodToStr(req.method()));
                          body.append("\nHeaders:\n");
                          for (const auto &[headerKey, headerValue] : req.headers()) {
                            body.append(headerKey).append(": ").append(headerValue).append("\n");
                          }
                          return HttpResponse().body(std::move(body));
                        });
                      }));

    std::jthread stopper([&server, &stopSignals] {
      int signal = 0;
      sigwait(&stopSignals, &signal);
      std::cout << "Received signal " << signal << ", shutting down\n";
      try {
        server.shutdown(std::chrono::seconds{10});
      } catch (const std::exception &ex) {
        std::cerr << ex.what() << '\n';
      }
    });

    try {
      server.run();  // blocking run, until Ctrl+C
    } catch (const std::exception &) {
      // unblocks the stopper thread
      pthread_kill(stopper.native_handle(), SIGTERM);
      throw;
    }
    std::cout << "Stats: \n" << server.stats().json_str() << '\n';
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
