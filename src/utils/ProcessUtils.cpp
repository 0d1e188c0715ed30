#include "ProcessUtils.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <sys/wait.h>

namespace ReelSync {

int runHiddenCommand(const std::string& cmdLine, std::string& output) {
    if (cmdLine.empty()) {
        output = "Error: empty command line";
        return -1;
    }

    std::string fullCmd = cmdLine + " 2>&1";
    FILE* pipe = popen(fullCmd.c_str(), "r");
    if (!pipe) {
        output += "Error: popen failed for command: " + cmdLine.substr(0, 200);
        return -1;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    int rc = pclose(pipe);
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return 128 + (WIFSIGNALED(rc) ? WTERMSIG(rc) : 0);
}

std::string getTempDir() {
    std::error_code ec;
    std::string tempDir = std::filesystem::temp_directory_path(ec).string();
    if (ec || tempDir.empty()) {
        return "/tmp/";
    }
    if (tempDir.back() != '/') {
        tempDir += '/';
    }
    return tempDir;
}

std::string quoteArg(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

void appendCommandLog(const std::string& logFile,
                      const std::string& label,
                      const std::string& command,
                      int exitCode,
                      const std::string& output,
                      const std::string& extra) {
    FILE* log = fopen((getTempDir() + logFile).c_str(), "a");
    if (!log) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char timeBuf[64] = {0};
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    std::strftime(timeBuf, sizeof(timeBuf), "%c", &tmBuf);

    fprintf(log, "\n[%s] %s\n", timeBuf, label.c_str());
    fprintf(log, "cmd: %s\n", command.c_str());
    fprintf(log, "exit: %d\n", exitCode);
    if (!extra.empty()) {
        fprintf(log, "extra: %s\n", extra.c_str());
    }

    // Keep only the tail of very long output
    const size_t maxTail = 4000;
    if (output.size() <= maxTail) {
        fprintf(log, "output:\n%s\n", output.c_str());
    } else {
        fprintf(log, "output (last %zu chars):\n%s\n", maxTail, output.substr(output.size() - maxTail).c_str());
    }

    fclose(log);
}

std::string resolveFfmpegPath() {
    // 1. Environment override
    const char* envPath = std::getenv("REELSYNC_FFMPEG_PATH");
    if (envPath != nullptr && envPath[0] != '\0') {
        return envPath;
    }

    // 2. PATH lookup
    std::string result;
    int rc = runHiddenCommand("command -v ffmpeg", result);
    if (rc == 0 && !result.empty()) {
        size_t newline = result.find('\n');
        if (newline != std::string::npos) {
            result = result.substr(0, newline);
        }
        while (!result.empty() && (result.back() == '\r' || result.back() == ' ')) {
            result.pop_back();
        }
        if (!result.empty() && result.find("ffmpeg") != std::string::npos) {
            return result;
        }
    }

    // 3. Hardcoded fallback
#if defined(__APPLE__)
    return "/opt/homebrew/bin/ffmpeg";
#else
    return "/usr/bin/ffmpeg";
#endif
}

int ShellCommandRunner::run(const std::string& cmdLine, std::string& output) {
    return runHiddenCommand(cmdLine, output);
}

} // namespace ReelSync
