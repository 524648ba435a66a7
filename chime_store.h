#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "protocol.h"
#include "voice_codec.h"

constexpr const char* DEFAULT_CHIME         = "doorbell";
constexpr size_t      MAX_CHIME_UPLOAD_SIZE = 5 * 1024 * 1024;

// Pre-encoded Opus frames of one chime; immutable once built
using ChimeFrames = std::vector<Bytes>;

struct ChimeInfo {
    std::string name;
    size_t      frames   = 0;
    double      duration = 0.0;  // seconds
};

enum class ChimeDelete {
    Deleted,
    InvalidName,
    Protected,
    NotFound,
};

// Chime WAV files on disk and their encoded frames in memory
class ChimeStore {
public:
    ChimeStore(std::filesystem::path directory, std::filesystem::path bundled_directory,
               EncoderFactory encoder_factory);

    ChimeStore(const ChimeStore&)            = delete;
    ChimeStore& operator=(const ChimeStore&) = delete;

    // Copies bundled defaults into the persistent directory when missing there
    size_t seed_bundled();

    // Seeds, then loads every *.wav of the persistent directory. Returns the number loaded.
    size_t load_all();

    // Decodes and encodes one WAV image; nullptr when it is not usable audio
    std::shared_ptr<const ChimeFrames> encode_wav(std::span<const uint8_t> wav) const;

    // Encodes raw 16 kHz mono PCM with a fresh encoder, zero-padding the last frame
    std::shared_ptr<const ChimeFrames> encode_pcm(std::span<const int16_t> pcm) const;

    // Stores the upload on disk and in memory. On failure returns nullopt and sets error.
    std::optional<ChimeInfo> upload(const std::string& name, std::span<const uint8_t> wav,
                                    std::string& error);

    ChimeDelete remove(const std::string& name);

    // Frames of the named chime, or of the first loaded chime when the name is unknown
    std::shared_ptr<const ChimeFrames> frames_or_first(const std::string& name) const;
    std::shared_ptr<const ChimeFrames> frames(const std::string& name) const;

    bool                     contains(const std::string& name) const;
    std::vector<ChimeInfo>   list() const;
    std::vector<std::string> names() const;
    size_t                   count() const;

    std::string current() const;

    // Exact selection; false leaves the current chime unchanged
    bool select(const std::string& name);

    // Selection from the control plane: unknown names fall back to the first loaded chime.
    // Returns the chime now active.
    std::string select_or_fallback(const std::string& name);

    // Adds frames without touching disk (used for generated chimes)
    void insert(const std::string& name, std::shared_ptr<const ChimeFrames> frames);

    const std::filesystem::path& directory() const {
        return directory_;
    }

private:
    std::shared_ptr<const ChimeFrames> load_file(const std::filesystem::path& path) const;
    static ChimeInfo                   info_for(const std::string& name, const ChimeFrames& frames);

    std::filesystem::path directory_;
    std::filesystem::path bundled_directory_;
    EncoderFactory        encoder_factory_;

    mutable std::mutex                                        mutex_;
    std::map<std::string, std::shared_ptr<const ChimeFrames>> chimes_;
    std::string                                               current_ = DEFAULT_CHIME;
};
