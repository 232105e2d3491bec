#pragma once
#include <hybridwork/schema/primitives.hpp>
#include <string_view>

namespace hybridwork::blake3 {

hybridwork::schema::hash32_t hash(const std::string_view& str);
hybridwork::schema::hash32_t hash(const hybridwork::schema::bytes_view_t& bytes);

}  // namespace hybridwork::blake3
