#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <tether/codec/composite_key_codec.hpp>
#include <tether/common/error.hpp>
#include <tether/schema/declaration.hpp>
#include <tether/schema/registry.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;

using assignments_t = std::vector<std::pair<std::string, std::string>>;

assignments_t parse_assignments(const std::string_view input) {
  auto out = assignments_t{};
  auto rest = input;
  while (!rest.empty()) {
    auto comma = rest.find(',');
    auto item = rest.substr(0, comma);
    auto eq = item.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      throw tether::common::configuration_error{
          "expected key=value, got '" + std::string{item} + "'"};
    }
    out.emplace_back(std::string{item.substr(0, eq)},
                     std::string{item.substr(eq + 1)});
    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  return out;
}

bool is_integer(const std::string& text) {
  auto value = int64_t{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  return !text.empty() && ec == std::errc{} && ptr == text.data() + text.size();
}

// Timestamps may be given in ISO-8601; everything else goes in as text and
// is checked by the codec.
tether::schema::composite_key_t make_composite_key(
    const tether::schema::entity_schema& schema,
    const assignments_t& assignments) {
  auto key = tether::schema::composite_key_t{};
  for (const auto& [id, text] : assignments) {
    const auto* field = schema.find(id);
    if (field != nullptr &&
        field->logical_type == tether::schema::logical_type_t::timestamp &&
        !is_integer(text)) {
      auto timestamp = tether::schema::try_parse_timestamp(text);
      if (!timestamp) {
        throw tether::common::type_coercion_error{
            id, "'" + text + "' is not an ISO-8601 timestamp"};
      }
      key.emplace(id, *timestamp);
      continue;
    }
    key.emplace(id, text);
  }
  return key;
}

tether::schema::flat_mapping_t make_flat_mapping(
    const assignments_t& assignments) {
  auto mapping = tether::schema::flat_mapping_t{};
  for (const auto& [id, text] : assignments) {
    if (text.empty()) {
      mapping.emplace(id, std::nullopt);
    } else {
      mapping.emplace(id, text);
    }
  }
  return mapping;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] %v");
  spdlog::set_level(spdlog::level::warn);

  auto config_path = std::string{};
  auto declarations = std::vector<std::string>{};
  auto model = std::string{};
  auto encode_input = std::string{};
  auto decode_input = std::string{};

  auto description = po::options_description{"tether_keytool"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "Read options from a configuration file")(
      "schema,s", po::value<std::vector<std::string>>(&declarations)->composing(),
      "Schema declaration, e.g. Name(id:uuid:partition, at:timestamp)")(
      "model,m", po::value<std::string>(&model),
      "Name of the referenced schema")(
      "encode,e", po::value<std::string>(&encode_input),
      "Composite key to flatten, as key=value,...")(
      "decode,d", po::value<std::string>(&decode_input),
      "Flat mapping to decode, as key=value,...")(
      "verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }
  if (model.empty() || (encode_input.empty() == decode_input.empty())) {
    std::cerr << "--model and exactly one of --encode/--decode are required\n"
              << description << std::endl;
    return 2;
  }

  try {
    auto registry = std::make_shared<tether::schema::schema_registry>();
    for (const auto& declaration : declarations) {
      registry->add(tether::schema::parse_schema_declaration(declaration));
    }
    spdlog::debug("Loaded {} schema(s)", declarations.size());

    auto codec = tether::codec::composite_key_codec{
        tether::codec::reference_config{.model = model},
        tether::schema::make_resolver(registry)};

    if (!encode_input.empty()) {
      auto key = make_composite_key(*codec.schema(),
                                    parse_assignments(encode_input));
      for (const auto& [id, text] : codec.encode(key)) {
        std::cout << id << "=" << text.value_or("") << "\n";
      }
    } else {
      auto mapping = make_flat_mapping(parse_assignments(decode_input));
      for (const auto& [id, value] : codec.decode(mapping)) {
        std::cout << id << "=" << tether::schema::to_display_string(value)
                  << "\n";
      }
    }
  } catch (const tether::common::error& ex) {
    spdlog::error("{} error: {}", tether::common::to_string(ex.code()),
                  ex.what());
    return 1;
  }
  return 0;
}
