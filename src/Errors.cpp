#include "ecmsio/Errors.hpp"

namespace ecmsio {

static std::string compose(const std::string& message,
                           const std::string& token,
                           const std::string& path)
{
    std::string out = message;
    if (!token.empty()) out += " ['" + token + "']";
    if (!path.empty())  out += " in '" + path + "'";
    return out;
}

FormatError::FormatError(const std::string& message,
                         std::string        token,
                         std::string        path)
    : std::runtime_error(compose(message, token, path)),
      token_(std::move(token)), path_(std::move(path))
{}

} // namespace ecmsio
