#include <tether/codec/validator.hpp>

namespace tether::codec {

tether::schema::flat_mapping_t validate(const composite_key_codec& codec,
                                        const tether::column::map_column& storage,
                                        const reference_value_t& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return storage.validate({});
  }
  return storage.validate(codec.encode(value));
}

}  // namespace tether::codec
