#include "WebDashboard.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#pragma comment(lib, "iphlpapi.lib")
#else
#include <ifaddrs.h>
#include <net/if.h>
#include <arpa/inet.h>
#include <netdb.h>
#endif

namespace {

std::string jsonEscape(const std::string& in) {
    std::ostringstream out;
    for (char c : in) {
        switch (c) {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n"; break;
        case '\r': out << "\\r"; break;
        case '\t': out << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                    << std::dec << std::setfill(' ');
            } else {
                out << c;
            }
        }
    }
    return out.str();
}

const char* boolStr(bool v) { return v ? "true" : "false"; }

cv::Mat waitingFrame(const std::string& text) {
    cv::Mat vis(360, 640, CV_8UC3, cv::Scalar(30, 30, 30));
    cv::putText(vis, text, {40, 180}, cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 200, 255), 2);
    return vis;
}

} // namespace

std::vector<std::string> WebDashboard::localIpAddresses() {
    std::vector<std::string> addrs;
#ifdef _WIN32
    ULONG bufLen = 15000;
    std::vector<unsigned char> buffer(bufLen);
    IP_ADAPTER_ADDRESSES* addresses = reinterpret_cast<IP_ADAPTER_ADDRESSES*>(buffer.data());
    if (GetAdaptersAddresses(AF_INET, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST |
                                           GAA_FLAG_SKIP_DNS_SERVER | GAA_FLAG_SKIP_FRIENDLY_NAME,
                              nullptr, addresses, &bufLen) == NO_ERROR) {
        for (auto* addr = addresses; addr != nullptr; addr = addr->Next) {
            if (addr->OperStatus != IfOperStatusUp) continue;
            for (auto* unicast = addr->FirstUnicastAddress; unicast; unicast = unicast->Next) {
                char bufferA[INET_ADDRSTRLEN]{};
                auto* sa = reinterpret_cast<sockaddr_in*>(unicast->Address.lpSockaddr);
                if (sa->sin_family == AF_INET && sa->sin_addr.S_un.S_addr != htonl(INADDR_LOOPBACK)) {
                    inet_ntop(AF_INET, &sa->sin_addr, bufferA, sizeof(bufferA));
                    addrs.emplace_back(bufferA);
                }
            }
        }
    }
#else
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) return addrs;
    for (auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_RUNNING) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
        char host[NI_MAXHOST];
        auto* sa = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sa->sin_addr, host, sizeof(host))) {
            addrs.emplace_back(host);
        }
    }
    freeifaddrs(ifaddr);
#endif
    return addrs;
}

bool WebDashboard::paramOn(const httplib::Request& req, const std::string& key, bool defaultValue) {
    if (!req.has_param(key)) return defaultValue;
    const auto& v = req.get_param_value(key);
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

int WebDashboard::paramInt(const httplib::Request& req, const std::string& key, int fallback) {
    if (!req.has_param(key)) return fallback;
    try {
        return std::stoi(req.get_param_value(key));
    } catch (const std::exception&) {
        return fallback;
    }
}

double WebDashboard::paramDouble(const httplib::Request& req, const std::string& key, double fallback) {
    if (!req.has_param(key)) return fallback;
    try {
        return std::stod(req.get_param_value(key));
    } catch (const std::exception&) {
        return fallback;
    }
}

void WebDashboard::start() {
    if (running_) return;
    running_ = true;

    server_.Get("/", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(dashboardHtml(), "text/html");
    });

    server_.Get("/api/state", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(stateJson(loop_.status()), "application/json");
    });

    server_.Post("/api/settings", [&](const httplib::Request& req, httplib::Response& res) {
        handleSettings(req, res);
    });

    server_.Get("/api/clear", [&](const httplib::Request&, httplib::Response& res) {
        loop_.clear();
        res.set_content("{\"status\":\"cleared\"}", "application/json");
    });

    server_.Get("/api/reset", [&](const httplib::Request& req, httplib::Response& res) {
        handleChannelOp(req, res, false);
    });

    server_.Get("/api/calibrate", [&](const httplib::Request& req, httplib::Response& res) {
        handleChannelOp(req, res, true);
    });

    server_.Get("/api/sensitivity", [&](const httplib::Request& req, httplib::Response& res) {
        loop_.adjustMinArea(paramInt(req, "delta", 0));
        res.set_content("{\"status\":\"ok\"}", "application/json");
    });

    server_.Get("/canvas.png", [&](const httplib::Request&, httplib::Response& res) {
        auto buf = loop_.encodeSnapshot(".png");
        if (buf.empty()) {
            res.status = 500;
            res.set_content("{\"error\":\"encode failed\"}", "application/json");
            return;
        }
        res.set_header("Content-Disposition", "inline; filename=\"whiteboard.png\"");
        res.set_content(std::string(buf.begin(), buf.end()), "image/png");
    });

    server_.Get("/stream.mjpg", [&](const httplib::Request& req, httplib::Response& res) {
        handleStream(req, res);
    });

    serverThread_ = std::thread([this]() {
        std::cout << "[Web] Dashboard listening on http://" << bind_ << ":" << port_ << std::endl;
        if (!server_.listen(bind_.c_str(), port_)) {
            std::cerr << "[Web] Failed to bind " << bind_ << ":" << port_ << std::endl;
        }
    });
}

void WebDashboard::stop() {
    if (!running_) return;
    running_ = false;
    server_.stop();
    if (serverThread_.joinable()) {
        serverThread_.join();
    }
}

cv::Mat WebDashboard::viewFrame(const std::string& view) const {
    if (view == "camera1" || view == "camera2") {
        cv::Mat frame = loop_.preview(view == "camera1" ? 1 : 2);
        return frame.empty() ? waitingFrame("Waiting for frames...") : frame;
    }
    return loop_.canvasFrame();
}

void WebDashboard::handleStream(const httplib::Request& req, httplib::Response& res) {
    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_header("Pragma", "no-cache");
    res.set_header("Connection", "close");
    const std::string view = req.has_param("view") ? req.get_param_value("view") : "canvas";
    const bool fast = paramOn(req, "fast", true);
    res.set_chunked_content_provider("multipart/x-mixed-replace; boundary=frame",
        [this, view, fast](size_t, httplib::DataSink& sink) {
            const auto frameDelay = std::chrono::milliseconds(static_cast<int>(1000.0 / std::max(1, config::MJPEG_STREAM_FPS)));
            while (running_) {
                cv::Mat frame = viewFrame(view);
                if (frame.empty()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    continue;
                }
                cv::Mat streamFrame = frame;
                cv::Mat resized;
                if (fast && config::STREAM_FAST_SCALE < 0.99) {
                    cv::resize(frame, resized, {}, config::STREAM_FAST_SCALE, config::STREAM_FAST_SCALE, cv::INTER_AREA);
                    streamFrame = resized;
                }
                std::vector<uchar> buf;
                std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, config::JPEG_QUALITY};
                if (!cv::imencode(".jpg", streamFrame, buf, params)) {
                    break;
                }
                std::string header = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: " + std::to_string(buf.size()) + "\r\n\r\n";
                sink.os.write(header.c_str(), static_cast<std::streamsize>(header.size()));
                sink.os.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
                sink.os.write("\r\n", 2);
                sink.os.flush();
                if (!sink.is_writable()) break;
                std::this_thread::sleep_for(frameDelay);
            }
            sink.done();
            return true;
        });
}

void WebDashboard::handleChannelOp(const httplib::Request& req, httplib::Response& res, bool calibrate) {
    const int channel = paramInt(req, "channel", 0);
    const bool ok = calibrate ? loop_.calibrate(channel) : loop_.reset(channel);
    if (!ok) {
        res.status = 404;
        res.set_content("{\"error\":\"unknown channel\"}", "application/json");
        return;
    }
    res.set_content(std::string("{\"status\":\"") + (calibrate ? "calibrating" : "reset") + "\",\"channel\":" +
                    std::to_string(channel) + "}", "application/json");
}

void WebDashboard::handleSettings(const httplib::Request& req, httplib::Response& res) {
    PipelineSettings snap = loop_.settings();
    TrackerParams& t = snap.tracker;
    t.minArea = paramDouble(req, "minArea", t.minArea);
    t.hsvLower = cv::Scalar(paramInt(req, "hMin", static_cast<int>(t.hsvLower[0])),
                            paramInt(req, "sMin", static_cast<int>(t.hsvLower[1])),
                            paramInt(req, "vMin", static_cast<int>(t.hsvLower[2])));
    t.hsvUpper = cv::Scalar(paramInt(req, "hMax", static_cast<int>(t.hsvUpper[0])),
                            paramInt(req, "sMax", static_cast<int>(t.hsvUpper[1])),
                            paramInt(req, "vMax", static_cast<int>(t.hsvUpper[2])));
    t.kernelSize = paramInt(req, "kernel", t.kernelSize);
    t.erode = paramOn(req, "erode", t.erode);
    snap.calibrationCadence = paramInt(req, "cadence", snap.calibrationCadence);
    snap.lostFrameTolerance = paramInt(req, "lostFrames", snap.lostFrameTolerance);
    snap.drawingEnabled = paramOn(req, "drawing", snap.drawingEnabled);

    loop_.applySettings(snap);
    res.set_content("{\"status\":\"ok\"}", "application/json");
}

std::string WebDashboard::stateJson(const LoopStatus& status) {
    std::ostringstream json;
    json << std::fixed << std::setprecision(2);
    json << "{";
    json << "\"calibrated\":" << boolStr(status.calibrated) << ",";
    json << "\"message\":\"" << jsonEscape(status.message) << "\",";
    json << "\"capabilityError\":\"" << jsonEscape(status.capabilityError) << "\",";
    json << "\"fps\":" << status.fps << ",";
    json << "\"ticks\":" << status.ticks << ",";
    json << "\"channels\":[";
    for (size_t i = 0; i < status.channels.size(); ++i) {
        const ChannelStatus& ch = status.channels[i];
        if (i > 0) json << ",";
        json << "{\"id\":" << ch.id
             << ",\"calibrated\":" << boolStr(ch.state == CalibrationState::Calibrated)
             << ",\"tracking\":" << boolStr(ch.tracking)
             << ",\"frames\":" << ch.frames
             << ",\"segments\":" << ch.segments;
        if (ch.pointer) {
            json << ",\"pointer\":{\"x\":" << ch.pointer->x << ",\"y\":" << ch.pointer->y << "}";
        } else {
            json << ",\"pointer\":null";
        }
        if (ch.canvasPoint) {
            json << ",\"canvas\":{\"x\":" << ch.canvasPoint->x << ",\"y\":" << ch.canvasPoint->y << "}";
        } else {
            json << ",\"canvas\":null";
        }
        json << ",\"seenIds\":[";
        for (size_t k = 0; k < ch.lastSeenIds.size(); ++k) {
            if (k > 0) json << ",";
            json << ch.lastSeenIds[k];
        }
        json << "]}";
    }
    json << "],";
    const PipelineSettings& s = status.settings;
    json << "\"settings\":{"
         << "\"minArea\":" << s.tracker.minArea << ","
         << "\"hMin\":" << static_cast<int>(s.tracker.hsvLower[0]) << ","
         << "\"sMin\":" << static_cast<int>(s.tracker.hsvLower[1]) << ","
         << "\"vMin\":" << static_cast<int>(s.tracker.hsvLower[2]) << ","
         << "\"hMax\":" << static_cast<int>(s.tracker.hsvUpper[0]) << ","
         << "\"sMax\":" << static_cast<int>(s.tracker.hsvUpper[1]) << ","
         << "\"vMax\":" << static_cast<int>(s.tracker.hsvUpper[2]) << ","
         << "\"kernel\":" << s.tracker.kernelSize << ","
         << "\"erode\":" << boolStr(s.tracker.erode) << ","
         << "\"cadence\":" << s.calibrationCadence << ","
         << "\"lostFrames\":" << s.lostFrameTolerance << ","
         << "\"drawing\":" << boolStr(s.drawingEnabled)
         << "}";
    json << "}";
    return json.str();
}

std::string WebDashboard::dashboardHtml() {
    std::ostringstream html;
    html << "<!DOCTYPE html><html><head><meta charset='utf-8'><title>" << config::WEB_DASHBOARD_TITLE << "</title>";
    html << "<style>body{font-family:Inter,Helvetica,Arial,sans-serif;margin:0;background:#0d1117;color:#e6edf3;}";
    html << ".top{padding:18px 24px;background:#161b22;display:flex;align-items:center;justify-content:space-between;border-bottom:1px solid #30363d;}";
    html << ".card{background:#161b22;border:1px solid #30363d;border-radius:10px;padding:16px;margin:12px;box-shadow:0 10px 30px rgba(0,0,0,0.3);}";
    html << ".grid{display:grid;grid-template-columns:2fr 1fr;gap:12px;}";
    html << ".pill{padding:4px 10px;border-radius:12px;background:#8b2f2f;color:white;font-weight:600;font-size:12px;} .pill.ok{background:#238636;}";
    html << ".controls label{display:block;margin-bottom:10px;} .controls input{width:100%;padding:8px;border-radius:8px;border:1px solid #30363d;background:#0d1117;color:#e6edf3;}";
    html << "button{padding:8px 12px;border-radius:8px;border:1px solid #30363d;background:#0d1117;color:#e6edf3;cursor:pointer;margin:0 6px 6px 0;}";
    html << "button.primary{background:#1f6feb;border-color:#388bfd;color:white;font-weight:700;}";
    html << "img.stream{width:100%;border-radius:10px;border:1px solid #30363d;background:#000;}";
    html << ".cams{display:grid;grid-template-columns:1fr 1fr;gap:8px;margin-top:8px;}";
    html << "</style></head><body>";
    html << "<div class='top'><div><div style='font-size:14px;color:#8b949e'>Shared canvas</div><div style='font-size:22px;font-weight:700;'>" << config::WEB_DASHBOARD_TITLE << "</div></div>";
    html << "<div id='ipList' style='font-size:14px;color:#8b949e'>";
    for (const auto& ip : localIpAddresses()) {
        html << "http://" << ip << ":" << config::WEB_PORT << " ";
    }
    html << "</div></div>";
    html << "<div class='grid'><div class='card'><div style='display:flex;align-items:center;justify-content:space-between;'>";
    html << "<div id='message' style='font-size:16px;font-weight:700;'></div><div class='pill' id='calPill'>NOT CALIBRATED</div></div>";
    html << "<div style='margin-top:10px;'><img class='stream' src='/stream.mjpg?view=canvas' /></div>";
    html << "<div class='cams'><img class='stream' src='/stream.mjpg?view=camera1' /><img class='stream' src='/stream.mjpg?view=camera2' /></div>";
    html << "<div id='stats' style='margin-top:12px;font-family:SFMono-Regular,Consolas,monospace;'></div>";
    html << "</div>";
    html << "<div><div class='card controls'><div style='font-size:13px;color:#8b949e;margin-bottom:8px'>Canvas</div>";
    html << "<button class='primary' id='drawBtn'>Drawing</button><button id='clearBtn'>Clear</button>"
         << "<a href='/canvas.png' download='whiteboard.png'><button>Save PNG</button></a>";
    html << "<div style='font-size:13px;color:#8b949e;margin:8px 0'>Calibration</div>";
    html << "<button data-op='calibrate' data-ch='1'>Calibrate 1</button><button data-op='calibrate' data-ch='2'>Calibrate 2</button>"
         << "<button data-op='reset' data-ch='1'>Reset 1</button><button data-op='reset' data-ch='2'>Reset 2</button>";
    html << "<div style='font-size:13px;color:#8b949e;margin:8px 0'>Sensitivity</div>";
    html << "<button id='lessBtn'>Less sensitive</button><button id='moreBtn'>More sensitive</button>";
    html << "<label>Min area<input type='number' id='minArea' step='50' min='100' /></label>";
    html << "<label>Hue min<input type='number' id='hMin' min='0' max='179' /></label>";
    html << "<label>Hue max<input type='number' id='hMax' min='0' max='179' /></label>";
    html << "<label>Saturation min<input type='number' id='sMin' min='0' max='255' /></label>";
    html << "<label>Calibration cadence<input type='number' id='cadence' min='1' max='30' /></label>";
    html << "<label>Lost-frame tolerance<input type='number' id='lostFrames' min='0' max='30' /></label>";
    html << "<button class='primary' id='saveBtn'>Apply</button>";
    html << "</div></div></div>";

    html << "<script>\nlet state={};\n"
         << "const fields=['minArea','hMin','hMax','sMin','cadence','lostFrames'];\n"
         << "function refresh(){fetch('/api/state').then(r=>r.json()).then(js=>{state=js.settings;"
         << "for(const f of fields){const el=document.getElementById(f);if(document.activeElement!==el)el.value=js.settings[f];}"
         << "document.getElementById('message').innerText=js.message;"
         << "const pill=document.getElementById('calPill');pill.innerText=js.calibrated?'CALIBRATED':'NOT CALIBRATED';pill.classList.toggle('ok',js.calibrated);"
         << "document.getElementById('drawBtn').innerText=js.settings.drawing?'Drawing: ON':'Drawing: OFF';"
         << "document.getElementById('stats').innerText=`${js.fps.toFixed(1)} fps | `+js.channels.map(c=>`cam${c.id} ${c.calibrated?'cal':'uncal'} ${c.tracking?'tracking':'lost'}${c.canvas?` (${c.canvas.x}, ${c.canvas.y})`:''}`).join(' | ');"
         << "});}\n"
         << "refresh();setInterval(refresh,500);\n"
         << "function push(extra){const p=new URLSearchParams();for(const f of fields)p.set(f,document.getElementById(f).value);"
         << "p.set('drawing',state.drawing?'1':'0');p.set('erode',state.erode?'1':'0');"
         << "if(extra)for(const k in extra)p.set(k,extra[k]);return fetch('/api/settings',{method:'POST',body:p}).then(refresh);}\n"
         << "document.getElementById('saveBtn').addEventListener('click',()=>push());\n"
         << "document.getElementById('drawBtn').addEventListener('click',()=>push({drawing:state.drawing?'0':'1'}));\n"
         << "document.getElementById('clearBtn').addEventListener('click',()=>fetch('/api/clear').then(refresh));\n"
         << "document.getElementById('lessBtn').addEventListener('click',()=>fetch('/api/sensitivity?delta=1').then(refresh));\n"
         << "document.getElementById('moreBtn').addEventListener('click',()=>fetch('/api/sensitivity?delta=-1').then(refresh));\n"
         << "for(const b of document.querySelectorAll('button[data-op]')){b.addEventListener('click',()=>fetch(`/api/${b.dataset.op}?channel=${b.dataset.ch}`).then(refresh));}\n"
         << "</script>";

    html << "</body></html>";
    return html.str();
}
