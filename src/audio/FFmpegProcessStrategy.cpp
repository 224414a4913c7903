/**
 * FFmpegProcessStrategy.cpp - External ffmpeg invocation with a hard timeout
 *
 * The blob goes to a temp file, ffmpeg converts it to 48 kHz mono WAV, and
 * the result is read back through SndfileStrategy. A timeout, a failed
 * spawn or a non-zero exit are ordinary strategy failures.
 */

#include "lts/audio/DecodeStrategies.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lts::audio {

namespace {

// Removes the file when it goes out of scope
struct TempFile {
    std::string path;

    ~TempFile() {
        if (!path.empty()) {
            std::remove(path.c_str());
        }
    }
};

std::string sanitizeExtension(const std::string& format) {
    std::string ext;
    for (char c : format) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            ext += c;
        }
    }
    return ext.empty() ? "bin" : ext;
}

// mkstemps() with a suffix; returns an empty path on failure
std::string createTempFile(const std::string& dir, const std::string& suffix) {
    std::string pattern = dir + "/lts_XXXXXX" + suffix;
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return "";
    }
    close(fd);
    return std::string(buf.data());
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.good()) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return out.good();
}

// PATH lookup done in the parent; the forked child must not allocate.
// Returns an empty string if no executable is found.
std::string resolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search = (path_env && *path_env) ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t begin = 0;
    while (begin <= search.size()) {
        size_t end = search.find(':', begin);
        if (end == std::string::npos) end = search.size();

        std::string dir = search.substr(begin, end - begin);
        std::string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        begin = end + 1;
    }
    return "";
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) return {};
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // anonymous namespace

FFmpegProcessStrategy::FFmpegProcessStrategy(std::string ffmpeg_path, int timeout_ms,
                                             std::string temp_dir)
    : ffmpeg_path_(std::move(ffmpeg_path))
    , timeout_ms_(timeout_ms)
    , temp_dir_(std::move(temp_dir)) {
}

StrategyResult FFmpegProcessStrategy::decode(const std::vector<uint8_t>& bytes,
                                             const std::string& format) const {
    const std::string executable = resolveExecutable(ffmpeg_path_);
    if (executable.empty()) {
        return StrategyResult::failure("ffmpeg not found: " + ffmpeg_path_);
    }

    TempFile input{createTempFile(temp_dir_, "." + sanitizeExtension(format))};
    TempFile output{createTempFile(temp_dir_, ".wav")};
    if (input.path.empty() || output.path.empty()) {
        return StrategyResult::failure("cannot create temp file in " + temp_dir_);
    }

    if (!writeFile(input.path, bytes)) {
        return StrategyResult::failure("cannot write " + input.path);
    }

    // argv and the executable path are prepared before fork(); the child
    // only calls open, dup2, execv and _exit
    std::vector<std::string> args = {
        executable, "-hide_banner", "-loglevel", "error", "-nostdin",
        "-i", input.path,
        "-ar", "48000", "-ac", "1", "-f", "wav", "-y", output.path
    };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return StrategyResult::failure(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execv(executable.c_str(), argv.data());
        _exit(127);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            return StrategyResult::failure(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            return StrategyResult::failure("ffmpeg timed out after " + std::to_string(timeout_ms_) + "ms");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!WIFEXITED(status)) {
        return StrategyResult::failure("ffmpeg terminated abnormally");
    }
    if (WEXITSTATUS(status) == 127) {
        return StrategyResult::failure("ffmpeg not found: " + ffmpeg_path_);
    }
    if (WEXITSTATUS(status) != 0) {
        return StrategyResult::failure("ffmpeg exited with status " + std::to_string(WEXITSTATUS(status)));
    }

    std::vector<uint8_t> wav = readFile(output.path);
    if (wav.empty()) {
        return StrategyResult::failure("ffmpeg produced no output");
    }

    StrategyResult result = wav_reader_.decode(wav, "wav");
    if (!result.ok) {
        result.error = "reading ffmpeg output: " + result.error;
    }
    return result;
}

} // namespace lts::audio
