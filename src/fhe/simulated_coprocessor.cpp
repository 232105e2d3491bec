#include <hybridwork/blake3/hash.hpp>
#include <hybridwork/fhe/attestation.hpp>
#include <hybridwork/fhe/simulated_coprocessor.hpp>
#include <hybridwork/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <tuple>

namespace hybridwork::fhe {

namespace {

using encoder_t = hybridwork::schema::encoding::encoder<
    hybridwork::schema::encoding::scale_encoder_tag>;

}  // namespace

simulated_coprocessor::simulated_coprocessor() {
  spdlog::debug("Simulated co-processor ready");
}

ciphertext simulated_coprocessor::store(
    const std::string_view operation,
    const std::initializer_list<const ciphertext*> operands,
    const uint64_t salt,
    const uint32_t value) {
  auto operand_handles = std::vector<hybridwork::schema::handle_id_t>{};
  operand_handles.reserve(operands.size());
  for (const auto* operand : operands) {
    operand_handles.push_back(operand->handle());
  }

  auto encoder = encoder_t{};
  auto material =
      encoder.encode(std::tuple{std::string{operation}, operand_handles, salt});
  auto handle = hybridwork::blake3::hash(
      hybridwork::schema::bytes_view_t{material.data(), material.size()});

  auto lock = std::scoped_lock{mutex_};
  values_.insert_or_assign(handle, value);
  return ciphertext{handle};
}

uint32_t simulated_coprocessor::value_of(const ciphertext& value) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = values_.find(value.handle());
  if (it == values_.end()) {
    throw arithmetic_error{"unknown ciphertext handle " +
                           hybridwork::schema::short_id(value.handle())};
  }
  return it->second;
}

ciphertext simulated_coprocessor::encrypt(const uint32_t constant) {
  return store("encrypt", {}, constant, constant);
}

ciphertext simulated_coprocessor::encrypt_input(const uint32_t value) {
  auto nonce = uint64_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    nonce = ++input_nonce_;
  }
  return store("input", {}, nonce, value);
}

ciphertext simulated_coprocessor::add(const ciphertext& lhs,
                                      const ciphertext& rhs) {
  return store("add", {&lhs, &rhs}, 0, value_of(lhs) + value_of(rhs));
}

ciphertext simulated_coprocessor::sub(const ciphertext& lhs,
                                      const ciphertext& rhs) {
  return store("sub", {&lhs, &rhs}, 0, value_of(lhs) - value_of(rhs));
}

ciphertext simulated_coprocessor::mul(const ciphertext& lhs,
                                      const ciphertext& rhs) {
  return store("mul", {&lhs, &rhs}, 0, value_of(lhs) * value_of(rhs));
}

ciphertext simulated_coprocessor::div(const ciphertext& lhs,
                                      const ciphertext& rhs) {
  auto divisor = value_of(rhs);
  if (divisor == 0) {
    throw arithmetic_error{"division by encrypted zero"};
  }
  return store("div", {&lhs, &rhs}, 0, value_of(lhs) / divisor);
}

ciphertext simulated_coprocessor::div(const ciphertext& lhs,
                                      const uint32_t divisor) {
  if (divisor == 0) {
    throw arithmetic_error{"division by zero scalar"};
  }
  return store("div_scalar", {&lhs}, divisor, value_of(lhs) / divisor);
}

ciphertext simulated_coprocessor::abs(const ciphertext& value) {
  auto raw = value_of(value);
  // Two's complement magnitude; 0x80000000 maps to itself.
  auto magnitude = (raw & 0x80000000u) != 0 ? (~raw + 1u) : raw;
  return store("abs", {&value}, 0, magnitude);
}

ciphertext simulated_coprocessor::bit_and(const ciphertext& lhs,
                                          const ciphertext& rhs) {
  return store("and", {&lhs, &rhs}, 0, value_of(lhs) & value_of(rhs));
}

ciphertext simulated_coprocessor::gt(const ciphertext& lhs,
                                     const ciphertext& rhs) {
  return store("gt", {&lhs, &rhs}, 0,
               value_of(lhs) > value_of(rhs) ? 1u : 0u);
}

ciphertext simulated_coprocessor::select(const ciphertext& condition,
                                         const ciphertext& when_true,
                                         const ciphertext& when_false) {
  auto chosen = value_of(condition) != 0 ? value_of(when_true)
                                         : value_of(when_false);
  return store("select", {&condition, &when_true, &when_false}, 0, chosen);
}

hybridwork::schema::bytes_t simulated_coprocessor::serialize(
    const ciphertext& value) {
  static_cast<void>(value_of(value));
  auto encoder = encoder_t{};
  return encoder.encode(value.handle());
}

hybridwork::schema::request_id_t simulated_coprocessor::request_decryption(
    const std::vector<hybridwork::schema::bytes_t>& ciphertexts) {
  auto encoder = encoder_t{};
  auto handles = std::vector<hybridwork::schema::handle_id_t>{};
  handles.reserve(ciphertexts.size());
  for (const auto& serialized : ciphertexts) {
    auto handle = encoder.try_decode<hybridwork::schema::handle_id_t>(
        hybridwork::schema::bytes_view_t{serialized});
    if (!handle.has_value() || serialized.size() != handle->size()) {
      throw arithmetic_error{"malformed serialized ciphertext"};
    }
    static_cast<void>(value_of(ciphertext{*handle}));
    handles.push_back(*handle);
  }

  auto lock = std::scoped_lock{mutex_};
  auto material = encoder.encode(std::tuple{++request_nonce_, handles});
  auto request_id = hybridwork::blake3::hash(
      hybridwork::schema::bytes_view_t{material.data(), material.size()});
  jobs_.insert_or_assign(request_id, std::move(handles));
  spdlog::debug("Queued decryption request {}",
                hybridwork::schema::short_id(request_id));
  return request_id;
}

std::optional<decryption_response> simulated_coprocessor::fulfil(
    const hybridwork::schema::request_id_t& request_id) {
  auto handles = std::vector<hybridwork::schema::handle_id_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = jobs_.find(request_id);
    if (it == jobs_.end()) {
      return std::nullopt;
    }
    handles = std::move(it->second);
    jobs_.erase(it);
  }

  auto values = std::vector<uint32_t>{};
  values.reserve(handles.size());
  for (const auto& handle : handles) {
    values.push_back(value_of(ciphertext{handle}));
  }

  auto response = decryption_response{};
  response.request_id = request_id;
  response.payload = encode_reveal_payload(values);
  auto message = make_reveal_message(
      request_id, hybridwork::schema::bytes_view_t{response.payload});
  response.proof = signer_.sign(hybridwork::schema::bytes_view_t{message});
  return response;
}

std::vector<hybridwork::schema::request_id_t>
simulated_coprocessor::pending_requests() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<hybridwork::schema::request_id_t>{};
  out.reserve(jobs_.size());
  for (const auto& [request_id, handles] : jobs_) {
    out.push_back(request_id);
  }
  return out;
}

hybridwork::schema::attestor_id_t simulated_coprocessor::attestor() const {
  return signer_.attestor();
}

}  // namespace hybridwork::fhe
