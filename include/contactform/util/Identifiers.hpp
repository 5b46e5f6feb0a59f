#pragma once

#include <chrono>
#include <string>

namespace contactform::util {

// Random (version 4) UUID in the canonical 8-4-4-4-12 form.
std::string generateUuid();

// UTC time as YYYY-MM-DDTHH:MM:SS.ffffff, no offset suffix.
std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint);
std::string makeIsoTimestamp();

} // namespace contactform::util
