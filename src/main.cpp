#include "CaptureFrameSource.h"
#include "Config.h"
#include "FrameProcessingLoop.h"
#include "VisionRuntime.h"
#include "WebDashboard.h"

#include <opencv2/core.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct ChannelSpec {
    int id;
    std::string source;
    cv::Scalar color;
};

} // namespace

class WhiteboardApp {
public:
    explicit WhiteboardApp(std::vector<ChannelSpec> channels);
    ~WhiteboardApp();

    void start();
    void stop();

    FrameProcessingLoop& loop() { return loop_; }

private:
    std::vector<ChannelSpec> specs_;
    FrameProcessingLoop loop_;
    std::vector<std::shared_ptr<CaptureFrameSource>> sources_;
    std::thread loopThread_;
    std::atomic<bool> stopLoop_{false};
    bool running_{false};
};

WhiteboardApp::WhiteboardApp(std::vector<ChannelSpec> channels)
    : specs_(std::move(channels))
    , loop_(VisionRuntime::instance())
{
    std::cout << "[WhiteboardApp] Canvas " << loop_.layout().width() << "x" << loop_.layout().height()
              << ", " << specs_.size() << " channel(s)" << std::endl;
}

WhiteboardApp::~WhiteboardApp() {
    stop();
}

void WhiteboardApp::start() {
    if (running_) return;

    for (const auto& spec : specs_) {
        auto source = std::make_shared<CaptureFrameSource>(spec.source);
        source->start();
        loop_.attach(spec.id, source, spec.color);
        sources_.push_back(source);
    }

    running_ = true;
    stopLoop_ = false;
    loopThread_ = std::thread([this] { loop_.run(stopLoop_); });
}

void WhiteboardApp::stop() {
    if (loopThread_.joinable()) {
        stopLoop_ = true;
        loopThread_.join();
    }
    for (const auto& spec : specs_) {
        loop_.detach(spec.id);
    }
    for (auto& source : sources_) {
        source->stop();
    }
    sources_.clear();
    running_ = false;
}

std::atomic<bool> gQuit{false};

void handleSignal(int) {
    gQuit = true;
}

int main(int argc, char** argv) {
    std::cout << "==================================" << std::endl;
    std::cout << "Whiteboard Vision" << std::endl;
    std::cout << "Two-camera shared canvas" << std::endl;
    std::cout << "==================================" << std::endl;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::vector<ChannelSpec> channels = {
        {1, argc > 1 ? argv[1] : std::to_string(config::CAM1_IDX), cv::Scalar(255, 0, 0)},   // blue
        {2, argc > 2 ? argv[2] : std::to_string(config::CAM2_IDX), cv::Scalar(0, 0, 255)},   // red
    };

    try {
        WhiteboardApp app(channels);
        app.start();

        WebDashboard web(app.loop(), config::WEB_BIND_ADDRESS, config::WEB_PORT);
        web.start();

        auto ips = WebDashboard::localIpAddresses();
        if (ips.empty()) {
            std::cout << "[Net] Browse to http://localhost:" << config::WEB_PORT << " for the dashboard" << std::endl;
        } else {
            std::cout << "[Net] Dashboard reachable at:" << std::endl;
            for (const auto& ip : ips) {
                std::cout << "  http://" << ip << ":" << config::WEB_PORT << std::endl;
            }
        }

        while (!gQuit.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        web.stop();
        app.stop();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
