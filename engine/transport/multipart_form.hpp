#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxguard {

// One decoded part of a multipart/form-data body
struct FormPart {
  std::string name;
  std::string filename;      ///< Empty for plain fields
  std::string content_type;  ///< Empty for plain fields
  std::string data;

  bool IsFile() const { return !filename.empty(); }
};

/**
 * @brief multipart/form-data body builder and parser
 *
 * Parts are emitted in insertion order. The boundary is random unless one is
 * given explicitly.
 */
class MultipartForm {
 public:
  MultipartForm();
  explicit MultipartForm(std::string boundary);

  void AddField(const std::string& name, const std::string& value);
  void AddFile(const std::string& name, const std::string& filename,
               const std::string& content_type, std::string data);

  // Read `path` and add it as a file part. Throws std::runtime_error if the
  // file cannot be read.
  void AddFileFromPath(const std::string& name, const std::string& path,
                       const std::string& content_type);

  // "multipart/form-data; boundary=..."
  std::string GetContentType() const;
  const std::string& GetBoundary() const { return boundary_; }

  std::string Build() const;

  size_t GetPartCount() const { return parts_.size(); }

  // Decode a body given its Content-Type header. Returns nullopt if the
  // content type has no boundary or the body is malformed.
  static std::optional<std::vector<FormPart>> Parse(const std::string& content_type,
                                                    const std::string& body);

 private:
  static std::string GenerateBoundary();

  std::string boundary_;
  std::vector<FormPart> parts_;
};

}  // namespace voxguard
