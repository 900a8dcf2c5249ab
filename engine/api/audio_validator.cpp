#include "audio_validator.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace voxguard {

namespace fs = std::filesystem;

std::string GetAudioMimeType(const std::string& extension) {
  std::string ext = extension;
  if (!ext.empty() && ext[0] == '.') {
    ext = ext.substr(1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "wav") return "audio/wav";
  if (ext == "opus") return "audio/opus";
  if (ext == "mp3") return "audio/mpeg";
  if (ext == "flac") return "audio/flac";
  return "";
}

bool HasAudioExtension(const std::string& path) {
  return !GetAudioMimeType(fs::path(path).extension().string()).empty();
}

AudioFileInfo ValidateAudioFile(const std::string& path) {
  AudioFileInfo info;
  std::error_code ec;

  if (!fs::exists(path, ec)) {
    info.error = "file not found: " + path;
    return info;
  }
  if (!fs::is_regular_file(path, ec)) {
    info.error = "not a regular file: " + path;
    return info;
  }

  info.mime_type = GetAudioMimeType(fs::path(path).extension().string());
  if (info.mime_type.empty()) {
    info.error = "unsupported audio format: " + path + " (expected .wav, .opus, .mp3 or .flac)";
    return info;
  }

  uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    info.error = "cannot stat " + path + ": " + ec.message();
    return info;
  }
  info.size_bytes = static_cast<uint64_t>(size);
  if (info.size_bytes == 0) {
    info.error = "file is empty: " + path;
    return info;
  }
  if (info.size_bytes > kMaxAudioFileBytes) {
    info.error = "file too large: " + path + " (" + std::to_string(info.size_bytes) + " bytes)";
    return info;
  }

  info.valid = true;
  return info;
}

}  // namespace voxguard
