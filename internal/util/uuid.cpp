#include "uuid.hpp"

#include <random>

namespace storygraph::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToHex(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(32);
  for (auto b : id) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string NewId() {
  return ToHex(GenerateUUID());
}

} // namespace storygraph::util
