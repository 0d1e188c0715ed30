#pragma once

#include "VideoProcessor.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ReelSync {

/**
 * @brief A registered, validated source clip
 */
struct VideoClip {
    std::string id;          // "<keyword>#<providerId>"
    std::string keyword;
    std::string providerId;
    std::string path;
    double duration = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;
};

/**
 * @brief Split a retrieval file name "<keyword_words>_<n>.<ext>" into keyword and provider id
 *
 * Underscores in the keyword part become spaces. Names without a trailing "_<n>"
 * use the whole stem as keyword and an empty provider id.
 * @return false for an empty stem
 */
bool parseClipFileName(const std::string& fileName, std::string& keyword, std::string& providerId);

// Lower-case, trim and collapse whitespace
std::string normalizeKeyword(const std::string& keyword);

bool isSupportedClipExtension(const std::string& path);

/**
 * @brief Append-only index of source clips keyed by search keyword
 *
 * Every clip is probed on registration; unreadable or zero-length files are
 * rejected and never enter the pool. Reads are safe while another thread registers.
 */
class ClipLibrary {
public:
    /**
     * @param probe Metadata reader used to validate clips
     * @param storageDir Directory that registerBytes() writes into
     */
    explicit ClipLibrary(std::shared_ptr<MediaProbe> probe, std::string storageDir = "");

    /**
     * @brief Validate and add a clip file
     * @throws InvalidMediaError if the file is missing, unreadable or has zero duration
     */
    VideoClip registerClip(const std::string& path, const std::string& keyword,
                           const std::string& providerId = "");

    /**
     * @brief Write downloaded bytes into the storage directory, then register the file
     * @throws InvalidMediaError if the bytes are empty, cannot be written, or do not probe
     */
    VideoClip registerBytes(const std::vector<uint8_t>& bytes, const std::string& keyword,
                            const std::string& fileName);

    /**
     * @brief Register every supported video file in a directory, keyed by file name
     * @return Number of clips added; invalid files are skipped with a warning
     */
    size_t registerDirectory(const std::string& directory);

    /**
     * @brief Clips registered under a keyword, in registration order
     * @param count Maximum number to return (0 = all)
     * @throws NotFoundError if the keyword has no clips
     */
    std::vector<VideoClip> pick(const std::string& keyword, size_t count) const;

    /**
     * @brief Pick for several keywords, serving empty keywords from the global pool
     *
     * Result is de-duplicated and in registration order. An empty keyword list
     * returns the whole pool.
     * @throws NotFoundError if the library holds no clips at all
     */
    std::vector<VideoClip> pickWithFallback(const std::vector<std::string>& keywords,
                                            size_t perKeyword) const;

    // Snapshot of every registered clip
    std::vector<VideoClip> getPool() const;
    std::vector<std::string> getKeywords() const;
    size_t size() const;
    bool isEmpty() const { return size() == 0; }

    const std::string& getStorageDirectory() const { return m_storageDir; }

private:
    std::shared_ptr<MediaProbe> m_probe;
    std::string m_storageDir;

    mutable std::mutex m_mutex;
    std::vector<VideoClip> m_clips;
};

} // namespace ReelSync
