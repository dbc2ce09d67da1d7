#pragma once

#include <ostream>
#include <string>

namespace gambit {

std::string service_name();
std::string service_version();
std::string about_message();
void print_about(std::ostream& os);

} // namespace gambit
