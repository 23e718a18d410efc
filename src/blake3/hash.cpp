#include <blake3.h>
#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const schema::bytes_view_t& bytes) {
    blake3_hasher_update(&state_, bytes.data(), bytes.size());
  }

  schema::hash32_t finalize() const {
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<schema::hash32_t>);
    auto output = schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

schema::hash32_t hash(const std::string_view& str) {
  return hash(schema::make_bytes_view(str));
}

schema::hash32_t hash(const schema::bytes_view_t& bytes) {
  auto state = hasher{};
  state.update(bytes);
  return state.finalize();
}

schema::hash32_t hash(std::initializer_list<schema::bytes_view_t> parts) {
  auto state = hasher{};
  for (const auto& part : parts) {
    state.update(part);
  }
  return state.finalize();
}

}  // namespace warden::blake3
