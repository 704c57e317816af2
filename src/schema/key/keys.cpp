#include <tally/schema/index_record.hpp>
#include <tally/schema/key/keys.hpp>

namespace tally::schema::key {

bytes_t make_record_key(const std::string_view id) {
  return make_bytes(id);
}

bytes_t make_role_key(const std::string_view principal) {
  auto key = make_bytes(kRolePrefix);
  key.insert(std::end(key), std::begin(principal), std::end(principal));
  return key;
}

bool is_reserved(const std::string_view id) {
  return id == kAccountIndexKey || id == kInvoiceIndexKey ||
         id.starts_with(kRolePrefix);
}

}  // namespace tally::schema::key
