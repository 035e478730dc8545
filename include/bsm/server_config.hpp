#pragma once

#include <optional>
#include <string>

#include "bsm/status.hpp"
#include "bsm/time_basis.hpp"

namespace bsm {

inline constexpr const char* kDefaultListenAddress = "0.0.0.0:50051";
inline constexpr const char* kListenAddressEnv = "BSM_LISTEN_ADDRESS";
inline constexpr const char* kValuationDateEnv = "BSM_VALUATION_DATE";

struct ServerConfig {
  std::string listen_address = kDefaultListenAddress;
  // Valuation date used when a request omits one; the UTC date when empty.
  std::optional<CalendarDate> valuation_date;
};

struct ServerConfigOutcome {
  EngineStatus status;
  ServerConfig config;
};

// Listen address: first positional argument, then BSM_LISTEN_ADDRESS, then the
// default. BSM_VALUATION_DATE pins the valuation date as YYYY-MM-DD.
ServerConfigOutcome load_server_config(int argc, char** argv);

}  // namespace bsm
