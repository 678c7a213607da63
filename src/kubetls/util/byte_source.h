#pragma once

#include <optional>
#include <string>

namespace kubetls {
namespace util {

// Decodes standard base64, ignoring embedded whitespace.
// Throws MalformedInputError(kInvalidBase64).
std::string DecodeBase64(const std::string& encoded);

// Reads a whole file. Throws IoError when it cannot be opened or read.
std::string ReadFileBytes(const std::string& path);

// Resolves one optional input field: inline base64 `data` when present,
// else the contents of `file` when present, else nullopt. `file` is left
// untouched when `data` is present.
std::optional<std::string> ResolveByteSource(
    const std::optional<std::string>& data,
    const std::optional<std::string>& file);

}  // namespace util
}  // namespace kubetls
