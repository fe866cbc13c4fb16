#pragma once
#include "Types.hpp"

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace ecmsio {

// first preamble lines: version, header line count, data header count,
// data start line
constexpr std::size_t kFixedMetadataLines = 4;

/*
 * One preamble line:   name \t comment \t attach_to_series \t type \t value
 *
 * Returns (key, typed value).  The key is "{attach_to_series}_{name}"
 * when the line belongs to a series, otherwise just the name.
 * Types: string, int, double, bool ("true" is true, anything else false).
 */
std::pair<std::string, nlohmann::json>
parse_metadata_line(const std::string& line, const std::string& path = {});

struct Preamble
{
    nlohmann::json           metadata = nlohmann::json::object();
    std::vector<std::string> series_headers;
    std::vector<std::string> column_headers;
    std::size_t              header_lines = 0;   // declared metadata line count
};

/* Reads the metadata lines (their total is declared within the first
 * kFixedMetadataLines) and the two header rows.  The stream is left at
 * the first data row. */
Preamble read_preamble(std::istream& in, const std::string& path = {});

/* Tab-separated numeric rows, `ncols` wide.  Short rows and empty cells
 * are padded with NaN; blank lines are skipped. */
Matrix read_table(std::istream& in, std::size_t ncols,
                  const std::string& path = {});

// splits on every tab; "" yields one empty field
std::vector<std::string> split_tabs(const std::string& line);

// strict number parsing: the whole token has to be consumed
bool parse_double(const std::string& token, double& out);
bool parse_int(const std::string& token, long long& out);

} // namespace ecmsio
