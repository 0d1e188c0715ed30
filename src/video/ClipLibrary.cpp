#include "ClipLibrary.h"
#include "tracing/Tracing.h"
#include "utils/DebugLogger.h"
#include "utils/Errors.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace ReelSync {

std::string normalizeKeyword(const std::string& keyword) {
    std::string out;
    bool pendingSpace = false;
    for (char c : keyword) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool isSupportedClipExtension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp4" || ext == ".mov" || ext == ".avi" || ext == ".mkv";
}

bool parseClipFileName(const std::string& fileName, std::string& keyword, std::string& providerId) {
    std::string stem = fs::path(fileName).stem().string();
    if (stem.empty()) {
        return false;
    }

    providerId.clear();
    size_t underscore = stem.rfind('_');
    if (underscore != std::string::npos && underscore + 1 < stem.size()) {
        std::string suffix = stem.substr(underscore + 1);
        bool numeric = std::all_of(suffix.begin(), suffix.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
        if (numeric && underscore > 0) {
            providerId = suffix;
            stem = stem.substr(0, underscore);
        }
    }

    std::replace(stem.begin(), stem.end(), '_', ' ');
    keyword = normalizeKeyword(stem);
    return !keyword.empty();
}

ClipLibrary::ClipLibrary(std::shared_ptr<MediaProbe> probe, std::string storageDir)
    : m_probe(std::move(probe))
    , m_storageDir(std::move(storageDir))
{
    if (m_storageDir.empty()) {
        m_storageDir = "clips";
    }
}

VideoClip ClipLibrary::registerClip(const std::string& path, const std::string& keyword,
                                    const std::string& providerId) {
    TRACE_FUNC();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw InvalidMediaError("Clip file not found: " + path);
    }
    if (!m_probe) {
        throw InvalidMediaError("No media probe configured for clip: " + path);
    }

    VideoInfo info;
    std::string probeError;
    if (!m_probe->probe(path, info, probeError)) {
        throw InvalidMediaError("Unreadable clip " + path + ": " + probeError);
    }
    if (!(info.duration > 0.0)) {
        throw InvalidMediaError("Clip has zero duration: " + path);
    }

    VideoClip clip;
    clip.keyword = normalizeKeyword(keyword);
    clip.path = path;
    clip.duration = info.duration;
    clip.width = info.width;
    clip.height = info.height;
    clip.fps = info.fps;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& existing : m_clips) {
        if (existing.path == path) {
            return existing;
        }
    }

    clip.providerId = providerId;
    if (clip.providerId.empty()) {
        size_t sameKeyword = std::count_if(m_clips.begin(), m_clips.end(),
                                           [&](const VideoClip& c) { return c.keyword == clip.keyword; });
        clip.providerId = std::to_string(sameKeyword);
    }
    clip.id = clip.keyword + "#" + clip.providerId;
    auto idTaken = [&](const std::string& id) {
        return std::any_of(m_clips.begin(), m_clips.end(), [&](const VideoClip& c) { return c.id == id; });
    };
    for (int n = 2; idTaken(clip.id); ++n) {
        clip.id = clip.keyword + "#" + clip.providerId + "-" + std::to_string(n);
    }
    m_clips.push_back(clip);

    std::ostringstream oss;
    oss << "Registered clip " << clip.id << " (" << clip.duration << "s, "
        << clip.width << "x" << clip.height << " @ " << clip.fps << " fps)";
    logDebug(oss.str());
    return clip;
}

VideoClip ClipLibrary::registerBytes(const std::vector<uint8_t>& bytes, const std::string& keyword,
                                     const std::string& fileName) {
    if (bytes.empty()) {
        throw InvalidMediaError("Empty clip payload for " + fileName);
    }

    std::error_code ec;
    fs::create_directories(m_storageDir, ec);
    if (ec) {
        throw InvalidMediaError("Cannot create clip storage " + m_storageDir + ": " + ec.message());
    }

    fs::path target = fs::path(m_storageDir) / fs::path(fileName).filename();
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw InvalidMediaError("Cannot write clip file " + target.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw InvalidMediaError("Short write for clip file " + target.string());
        }
    }

    std::string parsedKeyword;
    std::string providerId;
    parseClipFileName(target.filename().string(), parsedKeyword, providerId);
    return registerClip(target.string(), keyword.empty() ? parsedKeyword : keyword, providerId);
}

size_t ClipLibrary::registerDirectory(const std::string& directory) {
    TRACE_FUNC();
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        logWarn("Clip directory does not exist: " + directory);
        return 0;
    }

    // Sorted so registration order is stable across filesystems
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && isSupportedClipExtension(entry.path().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    size_t added = 0;
    for (const auto& file : files) {
        std::string keyword;
        std::string providerId;
        if (!parseClipFileName(file.filename().string(), keyword, providerId)) {
            logWarn("Skipping clip with unusable name: " + file.string());
            continue;
        }
        try {
            registerClip(file.string(), keyword, providerId);
            ++added;
        } catch (const InvalidMediaError& e) {
            logWarn(std::string("Skipping invalid clip: ") + e.what());
        }
    }

    logInfo("Registered " + std::to_string(added) + " of " + std::to_string(files.size()) +
            " clips from " + directory);
    return added;
}

std::vector<VideoClip> ClipLibrary::pick(const std::string& keyword, size_t count) const {
    const std::string key = normalizeKeyword(keyword);
    std::vector<VideoClip> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& clip : m_clips) {
            if (clip.keyword == key) {
                result.push_back(clip);
                if (count > 0 && result.size() >= count) break;
            }
        }
    }
    if (result.empty()) {
        throw NotFoundError("No clips for keyword '" + keyword + "'");
    }
    return result;
}

std::vector<VideoClip> ClipLibrary::pickWithFallback(const std::vector<std::string>& keywords,
                                                     size_t perKeyword) const {
    std::vector<VideoClip> pool = getPool();
    if (pool.empty()) {
        throw NotFoundError("Clip library is empty");
    }
    if (keywords.empty()) {
        return pool;
    }

    std::set<std::string> chosen;
    for (const auto& keyword : keywords) {
        try {
            for (const auto& clip : pick(keyword, perKeyword)) {
                chosen.insert(clip.id);
            }
        } catch (const NotFoundError&) {
            // Zero-clip keyword: take the next unused clips from the global pool
            size_t want = perKeyword > 0 ? perKeyword : 1;
            size_t taken = 0;
            for (const auto& clip : pool) {
                if (taken >= want) break;
                if (chosen.insert(clip.id).second) ++taken;
            }
            logWarn("No clips for keyword '" + keyword + "', served " + std::to_string(taken) +
                    " from global pool");
        }
    }

    std::vector<VideoClip> result;
    for (const auto& clip : pool) {
        if (chosen.count(clip.id)) {
            result.push_back(clip);
        }
    }
    return result;
}

std::vector<VideoClip> ClipLibrary::getPool() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clips;
}

std::vector<std::string> ClipLibrary::getKeywords() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keywords;
    for (const auto& clip : m_clips) {
        if (std::find(keywords.begin(), keywords.end(), clip.keyword) == keywords.end()) {
            keywords.push_back(clip.keyword);
        }
    }
    return keywords;
}

size_t ClipLibrary::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clips.size();
}

} // namespace ReelSync
