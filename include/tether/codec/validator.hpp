#pragma once
#include <tether/codec/composite_key_codec.hpp>
#include <tether/column/map_column.hpp>

namespace tether::codec {

/// Normalize anything assignable to a composite reference into the flat
/// mapping, then run the map column's own validation on the result.
tether::schema::flat_mapping_t validate(const composite_key_codec& codec,
                                        const tether::column::map_column& storage,
                                        const reference_value_t& value);

}  // namespace tether::codec
