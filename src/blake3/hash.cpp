#include <blake3.h>
#include <hybridwork/blake3/hash.hpp>

namespace hybridwork::blake3 {

namespace {

hybridwork::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = hybridwork::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

hybridwork::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

hybridwork::schema::hash32_t hash(
    const hybridwork::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace hybridwork::blake3
