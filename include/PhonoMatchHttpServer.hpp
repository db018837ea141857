#pragma once

#include <string>
#include <chrono>
#include <httplib.h>
#include "PhonoMatch.hpp"
#include <nlohmann/json.hpp>

class PhonoMatchHttpServer {
public:
    PhonoMatchHttpServer(std::string host, int port, std::string corpusPath = "");
    void run();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    phonomatch::PhonoMatch engine_;
    std::string corpusPath_;
    std::chrono::steady_clock::time_point startTime_;
};
