#include "ecmsio/Technique.hpp"
#include <stdexcept>

namespace ecmsio {

Technique parse_technique(const std::string& s)
{
    if (s == "EC")                   return Technique::EC;
    if (s == "MS")                   return Technique::MS;
    if (s == "EC-MS" || s == "ECMS") return Technique::ECMS;
    throw std::invalid_argument("Unknown technique '" + s +
                                "' (expected EC, MS or EC-MS)");
}

std::string to_string(Technique t)
{
    switch (t) {
        case Technique::EC:   return "EC";
        case Technique::MS:   return "MS";
        case Technique::ECMS: return "EC-MS";
    }
    return "EC-MS";
}

} // namespace ecmsio
