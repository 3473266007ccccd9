#include "UuidUtils.hpp"
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <picosha2.h>
#include <random>
#include <sstream>

namespace archiver {

namespace {

std::mt19937_64 &generator() {
  static std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

std::mutex g_generatorMutex;

} // namespace

std::string UuidUtils::generate() {
  uint64_t hi, lo;
  {
    std::lock_guard<std::mutex> lock(g_generatorMutex);
    hi = generator()();
    lo = generator()();
  }
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 1

  std::ostringstream out;
  out << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-'
      << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4)
      << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48) << '-'
      << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return out.str();
}

std::string UuidUtils::shortHash(const std::string &input, std::size_t length) {
  std::string hex = picosha2::hash256_hex_string(input);
  return hex.substr(0, length);
}

std::string UuidUtils::shortToken(const std::string &seed, std::size_t length) {
  return shortHash(seed + generate(), length);
}

} // namespace archiver
