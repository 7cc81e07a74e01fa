#include "control_server.h"
#include "defs.h"
#include <print>

namespace wick {

using json = nlohmann::json;

namespace {

void reply(httplib::Response &res, const json &body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

} // namespace

json status_json(const EngineStatus &s) {
  auto j = json{{"running", s.running},
                {"strategy", std::string{to_string(s.strategy)}},
                {"active", s.active},
                {"capacity", s.capacity},
                {"reserved", s.reserved},
                {"cooldowns", s.cooldowns},
                {"threshold", s.threshold},
                {"long_threshold", s.long_threshold},
                {"opened", s.opened},
                {"closed", s.closed},
                {"no_touch", s.no_touch},
                {"rotation_offset", s.rotation_offset}};

  if (s.strategy == Strategy::WickSpike) {
    j["params"] = {{"timeframe", std::string{timeframe}},
                   {"position_size_usdt", position_size_usdt},
                   {"leverage", leverage},
                   {"max_trades_per_scan", max_trades_per_scan},
                   {"score_min", score_min},
                   {"score_max", score_max}};
  } else {
    j["params"] = {{"symbol", std::string{dca_symbol}},
                   {"timeframe", std::string{dca_entry_timeframe}},
                   {"bank", dca_bank},
                   {"levels", dca_levels},
                   {"leverage", dca_leverage},
                   {"tp_pct", dca_tp_pct}};
    if (s.ranges)
      j["ranges"] = {{"tactical", {s.ranges->tactical.lower, s.ranges->tactical.upper}},
                     {"strategic", {s.ranges->strategic.lower, s.ranges->strategic.upper}}};
  }
  return j;
}

ControlServer::ControlServer(Engine &engine, std::string host, int port)
    : engine_{engine}, host_{std::move(host)}, port_{port} {
  setup_routes();
}

ControlServer::~ControlServer() { stop(); }

void ControlServer::setup_routes() {
  server_.Get("/status", [this](const httplib::Request &, httplib::Response &res) {
    reply(res, status_json(engine_.status()));
  });

  server_.Post("/run", [this](const httplib::Request &, httplib::Response &res) {
    auto started = engine_.start();
    if (not started) {
      const auto code = started.error() == EngineError::AlreadyRunning ? 409 : 503;
      reply(res, {{"ok", false}, {"error", std::string{to_string(started.error())}}}, code);
      return;
    }
    reply(res, {{"ok", true}});
  });

  server_.Post("/stop", [this](const httplib::Request &, httplib::Response &res) {
    engine_.stop();
    reply(res, {{"ok", true}});
  });

  server_.Post(R"(/close/([A-Za-z0-9_]+))",
               [this](const httplib::Request &req, httplib::Response &res) {
                 const auto symbol = std::string{req.matches[1]};
                 const auto closed = engine_.force_close(symbol);
                 reply(res, {{"ok", closed > 0}, {"closed", closed}},
                       closed > 0 ? 200 : 404);
               });

  server_.Post("/close", [this](const httplib::Request &, httplib::Response &res) {
    reply(res, {{"ok", true}, {"closed", engine_.force_close_all()}});
  });
}

bool ControlServer::start() {
  if (not server_.bind_to_port(host_, port_)) {
    std::println(stderr, "❌ Control API could not bind {}:{}", host_, port_);
    return false;
  }

  thread_ = std::jthread{[this] { server_.listen_after_bind(); }};
  server_.wait_until_ready();
  std::println("🎛️  Control API on http://{}:{}", host_, port_);
  return true;
}

void ControlServer::stop() {
  if (server_.is_running())
    server_.stop();
  if (thread_.joinable())
    thread_.join();
}

} // namespace wick
