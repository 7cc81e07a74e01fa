#pragma once

#include "engine.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace wick {

// Local operator API:
//   GET  /status          engine status as JSON
//   POST /run             start scanning
//   POST /stop            stop scanning
//   POST /close/<symbol>  force-close one symbol
//   POST /close           force-close everything
class ControlServer {
public:
    ControlServer(Engine &, std::string host, int port);
    ~ControlServer();

    // Listen on a background thread; false if the port could not be bound
    bool start();
    void stop();

private:
    Engine &engine_;
    std::string host_;
    int port_;
    httplib::Server server_;
    std::jthread thread_;

    void setup_routes();
};

nlohmann::json status_json(const EngineStatus &);

} // namespace wick
