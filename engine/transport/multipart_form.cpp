#include "multipart_form.hpp"
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>

namespace voxguard {

namespace {

// Value of `key="..."` or `key=...` inside a header value
std::string GetHeaderParam(const std::string& header, const std::string& key) {
  size_t pos = 0;
  while ((pos = header.find(key + "=", pos)) != std::string::npos) {
    // Must start a parameter, not end another name ("filename" vs "name")
    if (pos == 0 || header[pos - 1] == ' ' || header[pos - 1] == ';') {
      size_t start = pos + key.size() + 1;
      if (start < header.size() && header[start] == '"') {
        size_t end = header.find('"', start + 1);
        return header.substr(start + 1, end == std::string::npos ? std::string::npos : end - start - 1);
      }
      size_t end = header.find(';', start);
      return header.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }
    pos += key.size();
  }
  return "";
}

std::string ToLowerAscii(std::string value) {
  for (auto& c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value;
}

}  // namespace

MultipartForm::MultipartForm() : boundary_(GenerateBoundary()) {
}

MultipartForm::MultipartForm(std::string boundary) : boundary_(std::move(boundary)) {
  if (boundary_.empty()) {
    throw std::invalid_argument("Multipart boundary must not be empty");
  }
}

void MultipartForm::AddField(const std::string& name, const std::string& value) {
  parts_.push_back(FormPart{name, "", "", value});
}

void MultipartForm::AddFile(const std::string& name, const std::string& filename,
                            const std::string& content_type, std::string data) {
  parts_.push_back(FormPart{name, filename, content_type, std::move(data)});
}

void MultipartForm::AddFileFromPath(const std::string& name, const std::string& path,
                                    const std::string& content_type) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open " + path);
  }
  std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error("Failed to read " + path);
  }

  std::string filename = path;
  size_t slash = filename.find_last_of("/\\");
  if (slash != std::string::npos) {
    filename = filename.substr(slash + 1);
  }
  AddFile(name, filename, content_type, std::move(data));
}

std::string MultipartForm::GetContentType() const {
  return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartForm::Build() const {
  std::ostringstream oss;
  for (const auto& part : parts_) {
    oss << "--" << boundary_ << "\r\n";
    oss << "Content-Disposition: form-data; name=\"" << part.name << "\"";
    if (!part.filename.empty()) {
      oss << "; filename=\"" << part.filename << "\"";
    }
    oss << "\r\n";
    if (!part.content_type.empty()) {
      oss << "Content-Type: " << part.content_type << "\r\n";
    }
    oss << "\r\n" << part.data << "\r\n";
  }
  oss << "--" << boundary_ << "--\r\n";
  return oss.str();
}

std::optional<std::vector<FormPart>> MultipartForm::Parse(const std::string& content_type,
                                                         const std::string& body) {
  if (ToLowerAscii(content_type).find("multipart/form-data") == std::string::npos) {
    return std::nullopt;
  }
  std::string boundary = GetHeaderParam(content_type, "boundary");
  if (boundary.empty()) {
    return std::nullopt;
  }

  const std::string delimiter = "--" + boundary;
  size_t pos = body.find(delimiter);
  if (pos == std::string::npos) {
    return std::nullopt;
  }

  std::vector<FormPart> parts;
  while (true) {
    pos += delimiter.size();
    if (body.compare(pos, 2, "--") == 0) {
      return parts;  // Closing delimiter
    }
    if (body.compare(pos, 2, "\r\n") != 0) {
      return std::nullopt;
    }
    pos += 2;

    size_t headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string::npos) {
      return std::nullopt;
    }
    size_t next = body.find("\r\n" + delimiter, headers_end + 4);
    if (next == std::string::npos) {
      return std::nullopt;
    }

    FormPart part;
    std::istringstream headers(body.substr(pos, headers_end - pos));
    std::string line;
    while (std::getline(headers, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      size_t colon = line.find(':');
      if (colon == std::string::npos) {
        continue;
      }
      std::string name = ToLowerAscii(line.substr(0, colon));
      std::string value = line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(' '));
      if (name == "content-disposition") {
        part.name = GetHeaderParam(value, "name");
        part.filename = GetHeaderParam(value, "filename");
      } else if (name == "content-type") {
        part.content_type = value;
      }
    }
    part.data = body.substr(headers_end + 4, next - headers_end - 4);
    parts.push_back(std::move(part));
    pos = next + 2;
  }
}

std::string MultipartForm::GenerateBoundary() {
  static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string boundary = "----voxguard";
  for (int i = 0; i < 24; ++i) {
    boundary += kAlphabet[dist(rng)];
  }
  return boundary;
}

}  // namespace voxguard
