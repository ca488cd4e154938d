#pragma once

#include <functional>
#include <string>
#include <httplib.h>
#include <preflop/config.hpp>
#include <preflop/decision.hpp>

namespace preflop {

class PreflopServer {
public:
  explicit PreflopServer(EngineConfig config = EngineConfig::defaults());

  void start(const std::string& host = "0.0.0.0", int port = 8080);
  void stop() { _server.stop(); }

private:
  void configure_server();
  long capped_trials(long requested) const;

  DecisionEngine _engine;
  httplib::Server _server;
};

}
