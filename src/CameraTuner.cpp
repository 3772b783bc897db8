#include "CameraTuner.h"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

using std::string;
using std::vector;
using std::pair;

namespace camtuner {

// Properties we might set/read
static const int P_AUTOEXP     = cv::CAP_PROP_AUTO_EXPOSURE;
static const int P_EXPOSURE    = cv::CAP_PROP_EXPOSURE;
static const int P_GAIN        = cv::CAP_PROP_GAIN;
static const int P_BRIGHT      = cv::CAP_PROP_BRIGHTNESS;
static const int P_FPS         = cv::CAP_PROP_FPS;
static const int P_W           = cv::CAP_PROP_FRAME_WIDTH;
static const int P_H           = cv::CAP_PROP_FRAME_HEIGHT;

static void pushLog(vector<string>& log, const string& k, double v) {
    std::ostringstream oss; oss << k << "=" << v; log.push_back(oss.str());
}

vector<pair<int,double>> readAllKnownProps(cv::VideoCapture& cap) {
    vector<pair<int,double>> out = {
        {P_W,0},{P_H,0},{P_FPS,0},{P_AUTOEXP,0},{P_EXPOSURE,0},{P_GAIN,0},{P_BRIGHT,0}
    };
    for (auto& kv : out) kv.second = cap.get(kv.first);
    return out;
}

static void warmup(cv::VideoCapture& cap, int n) {
    cv::Mat f;
    for (int i=0;i<n;i++) cap.read(f);
}

static double meanGray(const cv::Mat& probe) {
    cv::Scalar m = cv::mean(probe);
    return (probe.channels()==1) ? m[0] : (0.114*m[0] + 0.587*m[1] + 0.299*m[2]);
}

OpenResult openAndTune(const Settings& s) {
    OpenResult r;
    for (int api : s.backendOrder) {
        r.cap.release();
        r.cap.open(s.index, api);
        if (!r.cap.isOpened()) continue;

        r.cap.set(P_W, s.width);
        r.cap.set(P_H, s.height);
        if (s.fps > 0) r.cap.set(P_FPS, s.fps);

        // V4L2 reports 3 = aperture priority (auto), 1 = manual.
        r.cap.set(P_AUTOEXP, s.useAutoExposure ? 3 : 1);

        // Let AE/AGC settle before judging brightness.
        warmup(r.cap, s.warmupFrames);

        r.log.clear();
        for (auto& kv : readAllKnownProps(r.cap)) pushLog(r.log, std::to_string(kv.first), kv.second);

        cv::Mat probe;
        if (!r.cap.read(probe) || probe.empty()) { r.ok=false; continue; }

        // A black probe usually means the driver ignored the AE request; flip once.
        double gray = meanGray(probe);
        if (gray < 15.0) {
            r.cap.set(P_AUTOEXP, s.useAutoExposure ? 1 : 3);
            warmup(r.cap, 6);
            if (r.cap.read(probe) && !probe.empty()) gray = meanGray(probe);
        }

        r.ok = (gray >= 15.0) || (!s.useAutoExposure);
        if (r.ok) return r;
    }
    r.ok = false;
    return r;
}

OpenResult openSource(const string& source, const Settings& s) {
    const bool numeric = !source.empty() &&
        std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (numeric) {
        Settings indexed = s;
        try {
            indexed.index = std::stoi(source);
        } catch (const std::out_of_range&) {
            OpenResult r;
            r.log.push_back("camera index out of range: " + source);
            return r;
        }
        return openAndTune(indexed);
    }

    OpenResult r;
    r.cap.open(source, cv::CAP_ANY);
    r.ok = r.cap.isOpened();
    if (r.ok) {
        for (auto& kv : readAllKnownProps(r.cap)) pushLog(r.log, std::to_string(kv.first), kv.second);
    }
    return r;
}

} // namespace camtuner
