#include "gambit/about.hpp"

namespace gambit {

std::string service_name() {
  return "gambit";
}

std::string service_version() {
  return "0.3.0";
}

std::string about_message() {
  return service_name() + " " + service_version() + " - multi-session chess over HTTP";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace gambit
