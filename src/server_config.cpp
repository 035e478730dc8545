#include "bsm/server_config.hpp"

#include <cstdlib>

namespace bsm {

ServerConfigOutcome load_server_config(int argc, char** argv) {
  ServerConfigOutcome outcome;
  ServerConfig& config = outcome.config;

  if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
    config.listen_address = argv[1];
  } else {
    const char* from_env = std::getenv(kListenAddressEnv);
    if (from_env != nullptr && from_env[0] != '\0') {
      config.listen_address = from_env;
    }
  }

  const char* pinned = std::getenv(kValuationDateEnv);
  if (pinned != nullptr && pinned[0] != '\0') {
    config.valuation_date = parse_calendar_date(pinned);
    if (!config.valuation_date) {
      outcome.status = invalid_input(std::string(kValuationDateEnv) + " must be a YYYY-MM-DD date, got '" +
                                     pinned + "'");
    }
  }
  return outcome;
}

}  // namespace bsm
