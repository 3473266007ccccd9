#pragma once

#include "types.hpp"
#include <string>

namespace archiver {

/**
 * InputResolver turns whatever the user typed (post URL, profile URL,
 * fediverse handle, bare username) into a FetchTarget.
 */
class InputResolver {
public:
  // Throws InputError (UnrecognizedLocation / UnrecognizedInput).
  static FetchTarget resolve(const std::string &raw);

  // Instance carried by the target, else the caller's override. Throws
  // InputError(InstanceRequired) when neither is available.
  static std::string resolveInstance(const FetchTarget &target,
                                     const std::string &instanceOverride);

  static std::string normalizeInstance(const std::string &instance);
};

} // namespace archiver
