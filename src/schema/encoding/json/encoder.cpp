#include <tally/schema/encoding/json/encoder.hpp>

namespace tally::schema::encoding::json {

tally::schema::bytes_t write_document(const Json::Value& root) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return tally::schema::make_bytes(Json::writeString(builder, root));
}

std::optional<Json::Value> read_document(
    const tally::schema::bytes_view_t& bytes) {
  auto builder = Json::CharReaderBuilder{};
  builder["allowComments"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = true;
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};

  const auto text = tally::schema::make_string_view(bytes);
  auto root = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &root,
                     &errors)) {
    return std::nullopt;
  }
  return root;
}

}  // namespace tally::schema::encoding::json
