#include <relic/schema/identifier.hpp>

namespace relic::schema {

std::string to_string(const identifier_t& id) {
  auto out = to_hex(id.creator_address);
  out.push_back(':');
  out.append(std::to_string(id.creation_num));
  return out;
}

}  // namespace relic::schema
