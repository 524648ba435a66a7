#include "chime_store.h"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include "audio_constants.h"
#include "logger.h"
#include "message_validator.h"
#include "wav_reader.h"

namespace fs = std::filesystem;

ChimeStore::ChimeStore(fs::path directory, fs::path bundled_directory,
                       EncoderFactory encoder_factory)
    : directory_(std::move(directory)),
      bundled_directory_(std::move(bundled_directory)),
      encoder_factory_(std::move(encoder_factory)) {}

size_t ChimeStore::seed_bundled() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        Log::error("Cannot create chime directory {}: {}", directory_.string(), ec.message());
        return 0;
    }
    if (bundled_directory_.empty() || !fs::is_directory(bundled_directory_, ec)) {
        return 0;
    }

    size_t copied = 0;
    for (const auto& entry: fs::directory_iterator(bundled_directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".wav") {
            continue;
        }
        fs::path dest = directory_ / entry.path().filename();
        if (fs::exists(dest, ec)) {
            continue;
        }
        fs::copy_file(entry.path(), dest, ec);
        if (ec) {
            Log::warn("Failed to copy bundled chime {}: {}", entry.path().filename().string(),
                      ec.message());
            continue;
        }
        Log::info("Copied bundled chime to persistent storage: {}", dest.filename().string());
        ++copied;
    }
    return copied;
}

size_t ChimeStore::load_all() {
    seed_bundled();

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        Log::warn("Chimes directory not found: {}", directory_.string());
        return 0;
    }

    std::vector<fs::path> wav_files;
    for (const auto& entry: fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".wav") {
            wav_files.push_back(entry.path());
        }
    }
    std::sort(wav_files.begin(), wav_files.end());

    size_t loaded = 0;
    for (const auto& path: wav_files) {
        std::string name   = path.stem().string();
        auto        frames = load_file(path);
        if (!frames) {
            Log::warn("Chime '{}' failed to load, skipped", name);
            continue;
        }
        Log::info("Chime '{}' loaded: {} frames", name, frames->size());
        insert(name, std::move(frames));
        ++loaded;
    }

    Log::info("Total chimes loaded: {}", count());
    return loaded;
}

std::shared_ptr<const ChimeFrames> ChimeStore::load_file(const fs::path& path) const {
    auto bytes = read_file_bytes(path);
    if (!bytes) {
        return nullptr;
    }
    return encode_wav(*bytes);
}

std::shared_ptr<const ChimeFrames> ChimeStore::encode_wav(std::span<const uint8_t> wav) const {
    auto pcm = decode_wav_to_voice_pcm(wav);
    if (!pcm || pcm->empty()) {
        return nullptr;
    }
    return encode_pcm(*pcm);
}

std::shared_ptr<const ChimeFrames> ChimeStore::encode_pcm(std::span<const int16_t> pcm) const {
    // Every chime gets its own encoder so no prediction history leaks between them
    auto encoder = encoder_factory_ ? encoder_factory_() : nullptr;
    if (!encoder) {
        Log::error("No encoder available for chime");
        return nullptr;
    }

    constexpr size_t FRAME = audio_constants::FRAME_SIZE;

    auto                 frames = std::make_shared<ChimeFrames>();
    std::vector<int16_t> chunk(FRAME);
    for (size_t offset = 0; offset < pcm.size(); offset += FRAME) {
        size_t take = std::min(FRAME, pcm.size() - offset);
        std::copy_n(pcm.begin() + static_cast<std::ptrdiff_t>(offset), take, chunk.begin());
        std::fill(chunk.begin() + static_cast<std::ptrdiff_t>(take), chunk.end(), 0);

        Bytes encoded;
        if (!encoder->encode(chunk, encoded)) {
            Log::warn("Opus encode failed at chime frame {}", frames->size());
            break;
        }
        frames->push_back(std::move(encoded));
    }

    if (frames->empty()) {
        return nullptr;
    }
    return frames;
}

std::optional<ChimeInfo> ChimeStore::upload(const std::string& name, std::span<const uint8_t> wav,
                                            std::string& error) {
    if (!message_validator::is_valid_chime_name(name)) {
        error = "Invalid chime name (use alphanumeric, dashes, underscores)";
        return std::nullopt;
    }
    if (wav.size() > MAX_CHIME_UPLOAD_SIZE) {
        error = "File too large (max 5MB)";
        return std::nullopt;
    }
    if (wav.size() < 44) {
        error = "File too small to be a valid WAV";
        return std::nullopt;
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    fs::path dest = directory_ / (name + ".wav");
    {
        std::ofstream file(dest, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "Cannot write chime file";
            Log::error("Cannot write chime file {}", dest.string());
            return std::nullopt;
        }
        file.write(reinterpret_cast<const char*>(wav.data()),
                   static_cast<std::streamsize>(wav.size()));
    }
    Log::info("Chime uploaded: '{}' ({} bytes) -> {}", name, wav.size(), dest.string());

    auto frames = encode_wav(wav);
    if (!frames) {
        fs::remove(dest, ec);
        error = "Failed to encode WAV (invalid format or codec error)";
        return std::nullopt;
    }

    ChimeInfo info = info_for(name, *frames);
    insert(name, std::move(frames));
    return info;
}

ChimeDelete ChimeStore::remove(const std::string& name) {
    if (!message_validator::is_valid_chime_name(name)) {
        return ChimeDelete::InvalidName;
    }
    if (name == DEFAULT_CHIME) {
        return ChimeDelete::Protected;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chimes_.erase(name) == 0) {
            return ChimeDelete::NotFound;
        }
        if (current_ == name) {
            if (chimes_.contains(DEFAULT_CHIME) || chimes_.empty()) {
                current_ = DEFAULT_CHIME;
            } else {
                current_ = chimes_.begin()->first;
            }
        }
    }

    std::error_code ec;
    fs::remove(directory_ / (name + ".wav"), ec);
    Log::info("Chime deleted: '{}'", name);
    return ChimeDelete::Deleted;
}

std::shared_ptr<const ChimeFrames> ChimeStore::frames_or_first(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = chimes_.find(name);
    if (it != chimes_.end()) {
        return it->second;
    }
    if (chimes_.empty()) {
        return nullptr;
    }
    return chimes_.begin()->second;
}

std::shared_ptr<const ChimeFrames> ChimeStore::frames(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = chimes_.find(name);
    return it != chimes_.end() ? it->second : nullptr;
}

bool ChimeStore::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chimes_.contains(name);
}

std::vector<ChimeInfo> ChimeStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChimeInfo>      result;
    result.reserve(chimes_.size());
    for (const auto& [name, frames]: chimes_) {
        result.push_back(info_for(name, *frames));
    }
    return result;
}

std::vector<std::string> ChimeStore::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    result;
    result.reserve(chimes_.size());
    for (const auto& [name, frames]: chimes_) {
        result.push_back(name);
    }
    return result;
}

size_t ChimeStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chimes_.size();
}

std::string ChimeStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

bool ChimeStore::select(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!chimes_.contains(name)) {
        return false;
    }
    current_ = name;
    return true;
}

std::string ChimeStore::select_or_fallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chimes_.contains(name)) {
        current_ = name;
    } else if (!chimes_.empty()) {
        current_ = chimes_.begin()->first;
        Log::warn("Chime '{}' not found, falling back to '{}'", name, current_);
    }
    return current_;
}

void ChimeStore::insert(const std::string& name, std::shared_ptr<const ChimeFrames> frames) {
    std::lock_guard<std::mutex> lock(mutex_);
    chimes_[name] = std::move(frames);
}

ChimeInfo ChimeStore::info_for(const std::string& name, const ChimeFrames& frames) {
    return ChimeInfo{name, frames.size(),
                     static_cast<double>(frames.size()) * audio_constants::FRAME_DURATION_MS /
                         1000.0};
}
