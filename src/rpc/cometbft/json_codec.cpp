#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/rpc/cometbft/json_codec.hpp>

namespace tally::rpc::cometbft {

namespace {

using json = nlohmann::json;

[[noreturn]] void malformed(const std::string_view what) {
  throw tally::common::transport_error{
      fmt::format("malformed CometBFT response: {}", what)};
}

std::string string_value(const json& object, std::string_view name);

json parse_result(const std::string_view body) {
  auto document = json::parse(body, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    malformed("body is not a JSON object");
  }
  if (auto error = document.find("error");
      error != document.end() && !error->is_null()) {
    auto message = string_value(*error, "message");
    if (auto data = error->find("data");
        data != error->end() && data->is_string()) {
      message += ": " + data->get<std::string>();
    }
    throw tally::common::transport_error{
        fmt::format("CometBFT RPC error: {}", message)};
  }
  auto result = document.find("result");
  if (result == document.end() || !result->is_object()) {
    malformed("missing result");
  }
  return *result;
}

const json& field(const json& object, const std::string_view name) {
  auto found = object.find(name);
  if (found == object.end()) {
    malformed(fmt::format("missing field '{}'", name));
  }
  return *found;
}

/// CometBFT prints 64-bit integers as strings and small ones as numbers.
uint64_t unsigned_value(const json& value, const std::string_view name) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }
  if (value.is_string()) {
    auto parsed = tally::schema::try_parse_uint64(value.get<std::string>());
    if (parsed) {
      return *parsed;
    }
  }
  malformed(fmt::format("field '{}' is not an unsigned integer", name));
}

std::string string_value(const json& object, const std::string_view name) {
  auto found = object.find(name);
  if (found == object.end() || found->is_null()) {
    return {};
  }
  if (!found->is_string()) {
    malformed(fmt::format("field '{}' is not a string", name));
  }
  return found->get<std::string>();
}

tally::schema::transaction_event_t parse_event(const json& event) {
  auto decoded = tally::schema::transaction_event_t{};
  decoded.type = string_value(event, "type");
  auto attributes = event.find("attributes");
  if (attributes == event.end() || attributes->is_null()) {
    return decoded;
  }
  if (!attributes->is_array()) {
    malformed("event attributes is not an array");
  }
  for (const auto& attribute : *attributes) {
    auto entry = tally::schema::transaction_event_attribute_t{};
    entry.key = string_value(attribute, "key");
    entry.value = string_value(attribute, "value");
    auto index = attribute.find("index");
    entry.index =
        index != attribute.end() && index->is_boolean() && index->get<bool>();
    decoded.attributes.push_back(std::move(entry));
  }
  return decoded;
}

}  // namespace

tally::schema::height_t parse_status(const std::string_view body) {
  auto result = parse_result(body);
  const auto& sync_info = field(result, "sync_info");
  return unsigned_value(field(sync_info, "latest_block_height"),
                        "latest_block_height");
}

tally::schema::block_result_t parse_block_results(const std::string_view body) {
  auto result = parse_result(body);
  auto block = tally::schema::block_result_t{};
  block.height = unsigned_value(field(result, "height"), "height");

  auto txs = result.find("txs_results");
  if (txs == result.end() || txs->is_null()) {
    return block;
  }
  if (!txs->is_array()) {
    malformed("txs_results is not an array");
  }
  for (const auto& tx : *txs) {
    auto decoded = tally::schema::transaction_result_t{};
    if (auto code = tx.find("code"); code != tx.end() && !code->is_null()) {
      decoded.code = static_cast<uint32_t>(unsigned_value(*code, "code"));
    }
    decoded.log = string_value(tx, "log");
    decoded.codespace = string_value(tx, "codespace");
    if (auto events = tx.find("events");
        events != tx.end() && events->is_array()) {
      for (const auto& event : *events) {
        decoded.events.push_back(parse_event(event));
      }
    }
    block.tx_results.push_back(std::move(decoded));
  }
  return block;
}

tally::schema::commit_t parse_commit(const std::string_view body) {
  auto result = parse_result(body);
  const auto& commit = field(field(result, "signed_header"), "commit");

  auto decoded = tally::schema::commit_t{};
  decoded.height = unsigned_value(field(commit, "height"), "height");
  const auto& signatures = field(commit, "signatures");
  if (signatures.is_null()) {
    return decoded;
  }
  if (!signatures.is_array()) {
    malformed("signatures is not an array");
  }
  for (const auto& signature : signatures) {
    auto entry = tally::schema::commit_signature_t{};
    entry.validator_address = string_value(signature, "validator_address");
    entry.block_id_flag = unsigned_value(field(signature, "block_id_flag"),
                                         "block_id_flag");
    if (auto vote_code = signature.find("vote_code");
        vote_code != signature.end() && !vote_code->is_null()) {
      entry.vote_code = unsigned_value(*vote_code, "vote_code");
    } else {
      entry.vote_code = entry.block_id_flag;
    }
    decoded.signatures.push_back(std::move(entry));
  }
  return decoded;
}

tally::schema::query_result_t parse_abci_query(const std::string_view body) {
  auto result = parse_result(body);
  const auto& response = field(result, "response");

  auto decoded = tally::schema::query_result_t{};
  if (auto code = response.find("code");
      code != response.end() && !code->is_null()) {
    decoded.code = static_cast<uint32_t>(unsigned_value(*code, "code"));
  }
  decoded.log = string_value(response, "log");
  decoded.info = string_value(response, "info");
  decoded.codespace = string_value(response, "codespace");
  if (auto height = response.find("height");
      height != response.end() && !height->is_null()) {
    decoded.height = static_cast<int64_t>(unsigned_value(*height, "height"));
  }

  auto decode_base64 = [](const std::string& encoded,
                          const std::string_view name) {
    auto bytes = tally::schema::try_from_base64(encoded);
    if (!bytes) {
      malformed(fmt::format("field '{}' is not base64", name));
    }
    return std::move(*bytes);
  };
  decoded.key = decode_base64(string_value(response, "key"), "key");
  decoded.value = decode_base64(string_value(response, "value"), "value");
  return decoded;
}

std::string make_abci_query_target(const std::string_view path,
                                   const tally::schema::bytes_view_t& data) {
  return fmt::format("/abci_query?path=%22{}%22&data=0x{}", path,
                     tally::schema::to_hex(data));
}

}  // namespace tally::rpc::cometbft
