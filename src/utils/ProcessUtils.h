#pragma once

#include <string>

namespace ReelSync {

// Run a command via the shell and capture stdout+stderr.
// Returns the process exit code (-1 when the shell could not be started); output is appended to 'output'.
int runHiddenCommand(const std::string& cmdLine, std::string& output);

// Temp directory path with trailing slash
std::string getTempDir();

// Single-quote an argument for /bin/sh
std::string quoteArg(const std::string& arg);

// Append a command, its exit code and the tail of its output to <tempdir>/<logFile>
void appendCommandLog(const std::string& logFile,
                      const std::string& label,
                      const std::string& command,
                      int exitCode,
                      const std::string& output,
                      const std::string& extra = "");

// REELSYNC_FFMPEG_PATH, then PATH lookup, then /usr/bin/ffmpeg
std::string resolveFfmpegPath();

/**
 * @brief Seam for external tool invocation
 *
 * The compositor and subtitle burner only talk to ffmpeg through this interface,
 * so tests can record command lines and fake outputs without a real binary.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a full command line
     * @param cmdLine Shell command line (arguments already quoted)
     * @param output Receives combined stdout+stderr
     * @return Exit code, 0 on success
     */
    virtual int run(const std::string& cmdLine, std::string& output) = 0;
};

class ShellCommandRunner : public CommandRunner {
public:
    int run(const std::string& cmdLine, std::string& output) override;
};

} // namespace ReelSync
