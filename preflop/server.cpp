#include <algorithm>
#include <optional>
#include <nlohmann/json.hpp>
#include <preflop/blockers.hpp>
#include <preflop/charts.hpp>
#include <preflop/equity.hpp>
#include <preflop/json_io.hpp>
#include <preflop/logging.hpp>
#include <preflop/server.hpp>

using json = nlohmann::json;

namespace preflop {

PreflopServer::PreflopServer(EngineConfig config) : _engine{std::move(config)} {
  configure_server();
}

void PreflopServer::start(const std::string& host, const int port) {
  Logger::log("Starting HTTP server on " + host + ":" + std::to_string(port) + "...");
  Logger::log(_engine.config().to_string());
  if(!_server.listen(host, port)) Logger::error("Failed to listen on " + host + ":" + std::to_string(port));
}

long PreflopServer::capped_trials(const long requested) const {
  const SimulationConfig& sim = _engine.config().simulation;
  if(requested <= 0) return sim.trials;
  return std::min(requested, sim.max_trials);
}

static void send_error(httplib::Response& res, const int status, const std::string& msg) {
  res.status = status;
  res.set_content(json{{"error", msg}}.dump(), "application/json");
}

static void handle(const httplib::Request& req, httplib::Response& res, const std::function<json(const json&)>& fn) {
  try {
    const json dat = json::parse(req.body);
    res.set_content(fn(dat).dump(), "application/json");
  }
  catch(const json::exception& e) {
    send_error(res, 400, std::string{"Malformed request: "} + e.what());
  }
  catch(const InvalidCardError& e) {
    send_error(res, 400, e.what());
  }
  catch(const std::invalid_argument& e) {
    send_error(res, 400, e.what());
  }
  catch(const std::exception& e) {
    Logger::log(req.path + " failed: " + e.what());
    send_error(res, 500, e.what());
  }
}

void PreflopServer::configure_server() {
  _server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(R"({"status":"ok"})", "application/json");
  });

  _server.Post("/decide", [this](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [this](const json& dat) {
      DecisionRequest request = request_from_json(dat);
      request.trials = capped_trials(request.trials);
      Logger::log("POST: /decide hand=" + request.hero.to_string() + ", position=" + request.position + ", line=" + line_to_str(request.line) +
          ", opponent=" + request.opponent);
      return json(_engine.decide(request));
    });
  });

  _server.Post("/equity", [this](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [this](const json& dat) {
      const Hand hero{dat.at("hand").get<std::string>()};
      const auto position = dat.value("villain_position", std::string{"CO"});
      const auto action = dat.value("action", std::string{"open"});
      const long trials = capped_trials(dat.value("trials", 0L));
      std::optional<uint64_t> requested_seed;
      if(dat.contains("seed") && !dat.at("seed").is_null()) requested_seed = dat.at("seed").get<uint64_t>();
      const uint64_t seed = choose_seed(requested_seed, _engine.config().simulation);
      const auto board = parse_board(dat.value("board", std::string{}));
      Logger::log("POST: /equity hand=" + hero.to_string() + ", villain=" + position + " " + action + ", trials=" + std::to_string(trials));
      const ChartRange chart = chart_range(resolve_position(position, _engine.config()), resolve_range_action(action), _engine.config());
      const EquityResult result = EquitySimulator{_engine.config().simulation}.estimate(hero, chart.range, trials, seed, board);
      json out = result;
      out["villain_position"] = pos_to_str(chart.position);
      out["villain_action"] = range_action_to_str(chart.action);
      out["range_percent"] = chart.range_percent;
      return out;
    });
  });

  _server.Post("/blockers", [this](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [this](const json& dat) {
      const Hand hero{dat.at("hand").get<std::string>()};
      Logger::log("POST: /blockers hand=" + hero.to_string());
      const BlockerAnalyzer analyzer{_engine.config()};
      const BlockerReport report = analyzer.analyze(hero);
      json out = report;
      out["raise_adjustment"] = analyzer.adjustment_for(report, BlockerAction::RAISE);
      out["bluff_adjustment"] = analyzer.adjustment_for(report, BlockerAction::BLUFF);
      out["call_adjustment"] = analyzer.adjustment_for(report, BlockerAction::CALL);
      return out;
    });
  });
}

}
