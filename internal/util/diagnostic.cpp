#include "diagnostic.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace curator::util {

std::string MakeDiagnostic(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
  google::protobuf::Struct diagnostic;
  for (const auto& [key, value] : fields) {
    (*diagnostic.mutable_fields())[std::string(key)].set_string_value(std::string(value));
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(diagnostic, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to render diagnostic: " + std::string(status.message()));
  }
  return json;
}

} // namespace curator::util
