#pragma once

#include <string>

namespace rangedl::detail {

// Runs curl_global_init once per process; throws std::runtime_error on failure.
void ensureCurlInitialized();

[[nodiscard]] std::string curlVersion();

} // namespace rangedl::detail
