#pragma once
#include <string>

namespace ecmsio {

// Which part of a combined EC-MS file the caller wants back.
enum class Technique {
    EC,      // electrochemistry only
    MS,      // mass spectrometry only
    ECMS     // both
};

Technique   parse_technique(const std::string& s);   // "EC", "MS", "EC-MS"
std::string to_string(Technique t);

inline bool includes_ec(Technique t) { return t != Technique::MS; }
inline bool includes_ms(Technique t) { return t != Technique::EC; }

} // namespace ecmsio
