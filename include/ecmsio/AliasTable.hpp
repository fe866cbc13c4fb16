#pragma once
#include <ankerl/unordered_dense.h>
#include <string>
#include <utility>
#include <vector>

namespace ecmsio {

/*
 * Logical channel name  ->  concrete series names, in lookup order.
 *
 * Keys keep the order in which they were first seen, targets keep their
 * insertion order.  The first target is the preferred one.
 */
class AliasTable
{
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    void add(const std::string& name, const std::string& target);

    bool contains(const std::string& name) const;
    const std::vector<std::string>& targets(const std::string& name) const;

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size()  const { return entries_.size(); }
    bool        empty() const { return entries_.empty(); }

private:
    std::vector<Entry>                                        entries_;
    ankerl::unordered_dense::map<std::string, std::size_t>   index_;
};

/*
 * Collects aliases from two sources and merges them once:  entries
 * contributed by data blocks always precede global defaults mapping the
 * same logical name.  Defaults never replace block entries.
 */
class AliasTableBuilder
{
public:
    void add_block_alias(const std::string& name, const std::string& target);
    void merge_block(const AliasTable& block);

    void add_default(const std::string& name, const std::string& target);
    void add_defaults(const AliasTable& defaults);

    AliasTable build() const;

private:
    AliasTable block_;
    AliasTable defaults_;
};

} // namespace ecmsio
