#include "contactform/util/Identifiers.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace contactform::util {

std::string generateUuid() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point timePoint) {
    using namespace std::chrono;

    const auto secTp = floor<seconds>(timePoint);
    const auto micros = duration_cast<microseconds>(timePoint - secTp).count();

    const std::time_t time = system_clock::to_time_t(secTp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::string makeIsoTimestamp() {
    return formatIsoTimestamp(std::chrono::system_clock::now());
}

} // namespace contactform::util
