#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace curator::util {

/*
  Structured per-row diagnostic, rendered as a JSON object:

      {"reason":"fingerprint_failed","path":"...","message":"..."}
*/
std::string MakeDiagnostic(std::initializer_list<std::pair<std::string_view, std::string_view>> fields);

} // namespace curator::util
