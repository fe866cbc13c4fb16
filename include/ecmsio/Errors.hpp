#pragma once
#include <stdexcept>
#include <string>

namespace ecmsio {

/* --------------------------------------------------------------------- */
/*  Raised for any malformed input.  A read either completes or fails     */
/*  with one of these; partially built payloads are never returned.       */
/* --------------------------------------------------------------------- */
class FormatError : public std::runtime_error
{
public:
    FormatError(const std::string& message,
                std::string        token,
                std::string        path = {});

    const std::string& token() const { return token_; }
    const std::string& path()  const { return path_; }

private:
    std::string token_;
    std::string path_;
};

// run-identifier pair that cannot be packed into one key without collision
class AmbiguousIdentifierError : public FormatError
{
public:
    using FormatError::FormatError;
};

} // namespace ecmsio
