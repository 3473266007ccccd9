#pragma once

#include <cstddef>
#include <string>

namespace archiver {

class UuidUtils {
public:
  // Random RFC 4122 version 4 UUID, lower-case.
  static std::string generate();

  // First `length` hex digits of SHA-256(input).
  static std::string shortHash(const std::string &input, std::size_t length);

  // Short random token, used for job ids and render tokens.
  static std::string shortToken(const std::string &seed, std::size_t length);
};

} // namespace archiver
