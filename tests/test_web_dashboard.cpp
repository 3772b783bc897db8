#include <gtest/gtest.h>
#include "WebDashboard.h"

#include <memory>

namespace {

class IdleFrameSource : public FrameSource {
public:
    bool latest(cv::Mat&) override { return false; }
    std::string describe() const override { return "idle"; }
};

} // namespace

TEST(WebDashboardJsonTest, StateJsonReportsChannelsAndSettings) {
    LoopStatus status;
    status.calibrated = false;
    status.message = "Say \"hi\"\nnow";
    status.capabilityError = "bad\x01";
    status.fps = 12.5;
    status.ticks = 7;

    ChannelStatus one;
    one.id = 1;
    one.state = CalibrationState::Calibrated;
    one.tracking = true;
    one.frames = 10;
    one.segments = 3;
    one.pointer = cv::Point2d(320.5, 240.25);
    one.canvasPoint = cv::Point(960, 540);
    one.lastSeenIds = {0, 1, 2, 3};

    ChannelStatus two;
    two.id = 2;
    two.frames = 4;
    two.lastSeenIds = {2};

    status.channels = {one, two};

    PipelineSettings& s = status.settings;
    s.tracker.minArea = 400.0;
    s.tracker.hsvLower = cv::Scalar(35, 50, 60);
    s.tracker.hsvUpper = cv::Scalar(85, 255, 250);
    s.tracker.kernelSize = 5;
    s.tracker.erode = false;
    s.calibrationCadence = 2;
    s.lostFrameTolerance = 1;
    s.drawingEnabled = false;

    const std::string expected =
        R"json({"calibrated":false,"message":"Say \"hi\"\nnow","capabilityError":"bad\u0001",)json"
        R"json("fps":12.50,"ticks":7,"channels":[)json"
        R"json({"id":1,"calibrated":true,"tracking":true,"frames":10,"segments":3,)json"
        R"json("pointer":{"x":320.50,"y":240.25},"canvas":{"x":960,"y":540},"seenIds":[0,1,2,3]},)json"
        R"json({"id":2,"calibrated":false,"tracking":false,"frames":4,"segments":0,)json"
        R"json("pointer":null,"canvas":null,"seenIds":[2]}],)json"
        R"json("settings":{"minArea":400.00,"hMin":35,"sMin":50,"vMin":60,"hMax":85,"sMax":255,"vMax":250,)json"
        R"json("kernel":5,"erode":false,"cadence":2,"lostFrames":1,"drawing":false}})json";

    EXPECT_EQ(WebDashboard::stateJson(status), expected);
}

TEST(WebDashboardJsonTest, EmptyStatusHasEmptyChannelList) {
    const std::string json = WebDashboard::stateJson(LoopStatus());
    EXPECT_NE(json.find(R"("channels":[])"), std::string::npos);
    EXPECT_NE(json.find(R"("capabilityError":"")"), std::string::npos);
}

class WebDashboardRouteTest : public ::testing::Test {
protected:
    WebDashboardRouteTest()
        : loop(VisionRuntime::instance(), CanvasLayout(), cv::Size(320, 240))
        , web(loop, "127.0.0.1", 0) {}

    FrameProcessingLoop loop;
    WebDashboard web;
};

TEST_F(WebDashboardRouteTest, SettingsKeepCurrentValueOnMalformedFields) {
    const PipelineSettings before = loop.settings();

    httplib::Request req;
    req.params.emplace("minArea", "800");
    req.params.emplace("hMin", "abc");
    req.params.emplace("kernel", "");
    req.params.emplace("cadence", "99999999999");
    req.params.emplace("lostFrames", "2");
    req.params.emplace("drawing", "0");
    req.params.emplace("erode", "maybe");
    httplib::Response res;
    web.handleSettings(req, res);

    EXPECT_EQ(res.body, R"({"status":"ok"})");
    const PipelineSettings after = loop.settings();
    EXPECT_DOUBLE_EQ(after.tracker.minArea, 800.0);
    EXPECT_EQ(after.tracker.hsvLower[0], before.tracker.hsvLower[0]);
    EXPECT_EQ(after.tracker.hsvUpper, before.tracker.hsvUpper);
    EXPECT_EQ(after.tracker.kernelSize, before.tracker.kernelSize);
    EXPECT_EQ(after.calibrationCadence, before.calibrationCadence);
    EXPECT_EQ(after.lostFrameTolerance, 2);
    EXPECT_FALSE(after.drawingEnabled);
    EXPECT_FALSE(after.tracker.erode);
}

TEST_F(WebDashboardRouteTest, SettingsWithoutFieldsChangeNothing) {
    const PipelineSettings before = loop.settings();

    httplib::Request req;
    httplib::Response res;
    web.handleSettings(req, res);

    const PipelineSettings after = loop.settings();
    EXPECT_DOUBLE_EQ(after.tracker.minArea, before.tracker.minArea);
    EXPECT_EQ(after.tracker.erode, before.tracker.erode);
    EXPECT_EQ(after.drawingEnabled, before.drawingEnabled);
    EXPECT_EQ(after.calibrationCadence, before.calibrationCadence);
}

TEST_F(WebDashboardRouteTest, UnknownChannelIsNotFound) {
    httplib::Request req;
    req.params.emplace("channel", "7");

    httplib::Response reset;
    web.handleChannelOp(req, reset, false);
    EXPECT_EQ(reset.status, 404);
    EXPECT_EQ(reset.body, R"({"error":"unknown channel"})");

    httplib::Response calibrate;
    web.handleChannelOp(req, calibrate, true);
    EXPECT_EQ(calibrate.status, 404);

    httplib::Request garbled;
    garbled.params.emplace("channel", "one");
    httplib::Response res;
    web.handleChannelOp(garbled, res, false);
    EXPECT_EQ(res.status, 404);
}

TEST_F(WebDashboardRouteTest, KnownChannelAcceptsResetAndCalibrate) {
    loop.attach(1, std::make_shared<IdleFrameSource>(), cv::Scalar(255, 0, 0));

    httplib::Request req;
    req.params.emplace("channel", "1");

    httplib::Response reset;
    web.handleChannelOp(req, reset, false);
    EXPECT_NE(reset.status, 404);
    EXPECT_EQ(reset.body, R"({"status":"reset","channel":1})");

    httplib::Response calibrate;
    web.handleChannelOp(req, calibrate, true);
    EXPECT_NE(calibrate.status, 404);
    EXPECT_EQ(calibrate.body, R"({"status":"calibrating","channel":1})");
}
