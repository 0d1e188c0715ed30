#pragma once

#include "utils/ProcessUtils.h"
#include "video/VideoProcessor.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ReelSync {
namespace testing {

// Unique scratch directory, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        auto now_ns = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / ("reelsync_" + tag + "_" + std::to_string(now_ns));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

    // Create a small placeholder file and return its path
    std::string touch(const std::string& name, const std::string& content = "data") const {
        std::string p = file(name);
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    std::filesystem::path m_path;
};

// Returns canned metadata: exact path first, then file name, then the default
class FakeMediaProbe : public MediaProbe {
public:
    FakeMediaProbe() {
        defaultInfo.width = 1920;
        defaultInfo.height = 1080;
        defaultInfo.fps = 30.0;
        defaultInfo.duration = 10.0;
        defaultInfo.codec = "h264";
    }

    bool probe(const std::string& path, VideoInfo& info, std::string& error) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        probed.push_back(path);
        std::string name = std::filesystem::path(path).filename().string();
        for (const auto& bad : failing) {
            if (path.find(bad) != std::string::npos) {
                error = "fake probe failure";
                return false;
            }
        }
        auto it = byPath.find(path);
        if (it != byPath.end()) { info = it->second; return true; }
        auto jt = byFileName.find(name);
        if (jt != byFileName.end()) { info = jt->second; return true; }
        info = defaultInfo;
        return true;
    }

    VideoInfo withDuration(double seconds) const {
        VideoInfo info = defaultInfo;
        info.duration = seconds;
        return info;
    }

    VideoInfo defaultInfo;
    std::map<std::string, VideoInfo> byPath;
    std::map<std::string, VideoInfo> byFileName;
    std::vector<std::string> failing;   // substrings of paths that fail to probe
    std::vector<std::string> probed;

private:
    std::mutex m_mutex;
};

// Records command lines and creates the file named after the final "-y"
class RecordingCommandRunner : public CommandRunner {
public:
    int run(const std::string& cmdLine, std::string& output) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        commands.push_back(cmdLine);
        for (const auto& bad : failOn) {
            if (cmdLine.find(bad) != std::string::npos) {
                output += "simulated ffmpeg failure";
                return 1;
            }
        }
        std::string out = outputPath(cmdLine);
        if (!out.empty()) {
            std::ofstream f(out, std::ios::binary);
            f << "fake media";
        }
        return 0;
    }

    // Argument after the last " -y ", shell quotes removed
    static std::string outputPath(const std::string& cmdLine) {
        size_t pos = cmdLine.rfind(" -y ");
        if (pos == std::string::npos) return "";
        std::string arg = cmdLine.substr(pos + 4);
        std::string out;
        bool quoted = false;
        for (size_t i = 0; i < arg.size(); ++i) {
            char c = arg[i];
            if (c == '\'') { quoted = !quoted; continue; }
            if (c == '\\' && !quoted && i + 1 < arg.size()) { out += arg[++i]; continue; }
            if (c == ' ' && !quoted) break;
            out += c;
        }
        return out;
    }

    size_t countContaining(const std::string& needle) const {
        size_t n = 0;
        for (const auto& c : commands) {
            if (c.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    std::vector<std::string> commands;
    std::vector<std::string> failOn;    // substrings that make a command fail

private:
    std::mutex m_mutex;
};

// Short decaying clicks at the given times
inline std::vector<float> makeClickTrack(const std::vector<double>& beatTimes, int sampleRate, double duration) {
    int n = int(duration * sampleRate);
    std::vector<float> s(n, 0.0f);
    for (double bt : beatTimes) {
        int idx = int(bt * sampleRate);
        if (idx >= 0 && idx < n) s[idx] = 1.0f;
    }
    for (int i = 1; i < n; ++i) s[i] += 0.5f * s[i - 1];
    return s;
}

// Steady sine; with sr 16000 and 437.5 Hz it sits exactly on an FFT bin of a 2048 window
inline std::vector<float> makeSine(double frequency, int sampleRate, double duration, float amplitude = 0.5f) {
    int n = int(duration * sampleRate);
    std::vector<float> s(n);
    for (int i = 0; i < n; ++i) {
        s[i] = amplitude * float(std::sin(2.0 * 3.14159265358979323846 * frequency * i / sampleRate));
    }
    return s;
}

} // namespace testing
} // namespace ReelSync
