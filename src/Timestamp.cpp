#include "ecmsio/Timestamp.hpp"
#include "ecmsio/Errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ecmsio {

double parse_name_timestamp(const std::string& text, const std::string& path)
{
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, kNameTimestampFormat.c_str());
    if (ss.fail())
        throw FormatError("Cannot read a timestamp (expected YYYY-MM-DD HH_MM_SS)",
                          text, path);
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1))
        throw FormatError("Timestamp out of range", text, path);
    return static_cast<double>(t);
}

double tstamp_from_stem(const std::string& stem, const std::string& path)
{
    std::istringstream words(stem);
    std::string date, time;
    words >> date >> time;
    return parse_name_timestamp(date + " " + time, path);
}

} // namespace ecmsio
