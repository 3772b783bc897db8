#pragma once

#include "FrameProcessingLoop.h"

#include "httplib.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

// Browser front end: live MJPEG of the canvas and camera previews, JSON
// status and the UI operations (clear, reset, calibrate, settings).
class WebDashboard {
public:
    WebDashboard(FrameProcessingLoop& loop, const std::string& bind, int port)
        : loop_(loop), bind_(bind), port_(port) {}
    ~WebDashboard() { stop(); }

    void start();
    void stop();

    static std::vector<std::string> localIpAddresses();
    // JSON body served at /api/state.
    static std::string stateJson(const LoopStatus& status);

    // POST /api/settings. Missing or unparsable fields keep their current value.
    void handleSettings(const httplib::Request& req, httplib::Response& res);
    // /api/reset and /api/calibrate; 404 for an unknown channel.
    void handleChannelOp(const httplib::Request& req, httplib::Response& res, bool calibrate);

private:
    static bool paramOn(const httplib::Request& req, const std::string& key, bool defaultValue = false);
    static int paramInt(const httplib::Request& req, const std::string& key, int fallback);
    static double paramDouble(const httplib::Request& req, const std::string& key, double fallback);

    static std::string dashboardHtml();

    void handleStream(const httplib::Request& req, httplib::Response& res);
    cv::Mat viewFrame(const std::string& view) const;

    FrameProcessingLoop& loop_;
    std::string bind_;
    int port_;
    httplib::Server server_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
};
