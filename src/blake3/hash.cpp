#include <blake3.h>
#include <credence/blake3/hash.hpp>

namespace credence::blake3 {

namespace {

// Owns one hasher for the duration of a digest.
class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
    return *this;
  }

  credence::schema::hash32_t finalize() const {
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<credence::schema::hash32_t>);
    auto output = credence::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

credence::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

credence::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

}  // namespace credence::blake3
