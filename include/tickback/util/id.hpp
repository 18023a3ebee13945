#pragma once

#include <cstdint>
#include <format>
#include <random>
#include <string>

namespace tickback {

// Random RFC 4122 version 4 UUID.
inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

// 32 lowercase hex characters: a UUID with the dashes stripped.
inline auto generate_unique_id() -> std::string {
  auto uuid = generate_uuid();
  std::erase(uuid, '-');
  return uuid;
}

}  // namespace tickback
