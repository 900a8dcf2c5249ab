#pragma once

#include <cstdint>
#include <string>

namespace voxguard {

// Largest audio upload accepted by the API
constexpr uint64_t kMaxAudioFileBytes = 100ull * 1024 * 1024;

struct AudioFileInfo {
  bool valid = false;
  std::string error;      ///< Reason when !valid
  std::string mime_type;
  uint64_t size_bytes = 0;
};

// MIME type for a supported extension (".wav" or "wav", any case), empty otherwise
std::string GetAudioMimeType(const std::string& extension);

// True if the file name has a supported audio extension
bool HasAudioExtension(const std::string& path);

// Check that `path` is an existing, non-empty regular file of at most
// kMaxAudioFileBytes with a supported extension.
AudioFileInfo ValidateAudioFile(const std::string& path);

}  // namespace voxguard
