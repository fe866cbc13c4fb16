#pragma once
#include <cstddef>
#include <string>

namespace ecmsio {

// "2021-03-15 18_50_10", the form used in file and directory names
inline const std::string kNameTimestampFormat = "%Y-%m-%d %H_%M_%S";
constexpr std::size_t    kNameTimestampLength = 19;

// local-time string -> unix seconds; FormatError if it does not parse
double parse_name_timestamp(const std::string& text, const std::string& path = {});

// timestamp from the first two space-separated words of a file stem
double tstamp_from_stem(const std::string& stem, const std::string& path = {});

} // namespace ecmsio
