#include "kubetls/util/byte_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "kubetls/error/tls_error.h"

namespace kubetls {
namespace util {

std::string DecodeBase64(const std::string& encoded) {
  std::string compact;
  compact.reserve(encoded.size());
  std::copy_if(encoded.begin(), encoded.end(), std::back_inserter(compact),
               [](char c) { return !absl::ascii_isspace(c); });

  std::string decoded;
  if (!absl::Base64Unescape(compact, &decoded)) {
    throw MalformedInputError(MalformedInputReason::kInvalidBase64,
                              "inline data is not valid base64");
  }
  return decoded;
}

std::string ReadFileBytes(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec) &&
      !std::filesystem::is_regular_file(path, ec)) {
    throw IoError(path, "not a regular file");
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in)
    throw IoError(path, std::strerror(errno));

  try {
    std::string bytes((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (in.bad())
      throw IoError(path, "read failed");
    return bytes;
  } catch (const std::ios_base::failure& e) {
    throw IoError(path, e.what());
  }
}

std::optional<std::string> ResolveByteSource(
    const std::optional<std::string>& data,
    const std::optional<std::string>& file) {
  if (data)
    return DecodeBase64(*data);
  if (file)
    return ReadFileBytes(*file);
  return std::nullopt;
}

}  // namespace util
}  // namespace kubetls
