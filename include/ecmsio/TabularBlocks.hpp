#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ecmsio {

/* --------------------------------------------------------------------- */
/*  Column grouping                                                      */
/*                                                                       */
/*  A series header names the block starting at its column; empty cells  */
/*  that follow continue that block.  `end` is the column of the next    */
/*  named cell, or the row length for the last block.                    */
/* --------------------------------------------------------------------- */
struct BlockRange
{
    std::string header;
    std::size_t begin = 0;
    std::size_t end   = 0;

    std::size_t width() const { return end - begin; }
};

std::vector<BlockRange> split_blocks(const std::vector<std::string>& series_headers);

/* --------------------------------------------------------------------- */
/*  Row grouping of an embedded multi-technique log                      */
/* --------------------------------------------------------------------- */
struct RowRange
{
    std::size_t begin = 0;
    std::size_t end   = 0;

    std::size_t size() const { return end - begin; }
    bool operator==(const RowRange& o) const { return begin == o.begin && end == o.end; }
};

// experiment * 1000 + technique; throws AmbiguousIdentifierError if the
// pair does not fit that packing
std::int64_t composite_run_key(double experiment, double technique,
                               const std::string& path = {});

// maximal runs of equal consecutive keys, in row order; a key that comes
// back after a different one starts a new run
std::vector<RowRange> split_runs(const std::vector<std::int64_t>& keys);

} // namespace ecmsio
