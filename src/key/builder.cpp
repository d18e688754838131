#include <tether/key/builder.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <ranges>

using namespace tether::schema;

namespace tether::key {

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const uuid_t& uuid) {
  std::ranges::copy(uuid, std::back_inserter(data));
  return *this;
}

builder& builder::write(const wire_value_t& value) {
  write(static_cast<uint8_t>(value.index()));
  std::visit(overloaded{[](const std::monostate&) {},
                        [this](const std::string& arg) {
                          this->write(static_cast<uint32_t>(arg.size()));
                          this->write(std::string_view{arg});
                        },
                        [this](const int64_t arg) { this->write(arg); },
                        [this](const double arg) {
                          this->write(std::bit_cast<uint64_t>(arg));
                        },
                        [this](const bool arg) {
                          this->write(static_cast<uint8_t>(arg ? 1 : 0));
                        },
                        [this](const uuid_t& arg) { this->write(arg); },
                        [this](const bytes_t& arg) {
                          this->write(static_cast<uint32_t>(arg.size()));
                          this->write(std::span(arg.data(), arg.size()));
                        }},
             value);
  return *this;
}

}  // namespace tether::key
