#include "ecmsio/AliasTable.hpp"
#include <algorithm>
#include <stdexcept>

namespace ecmsio {

void AliasTable::add(const std::string& name, const std::string& target)
{
    auto it = index_.find(name);
    if (it == index_.end()) {
        index_.emplace(name, entries_.size());
        entries_.push_back({name, {target}});
        return;
    }
    auto& list = entries_[it->second].second;
    if (std::find(list.begin(), list.end(), target) == list.end())
        list.push_back(target);
}

bool AliasTable::contains(const std::string& name) const
{
    return index_.find(name) != index_.end();
}

const std::vector<std::string>& AliasTable::targets(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        throw std::out_of_range("No alias named '" + name + "'");
    return entries_[it->second].second;
}

/* ---------------------------------------------------------------------- */
void AliasTableBuilder::add_block_alias(const std::string& name,
                                        const std::string& target)
{
    block_.add(name, target);
}

void AliasTableBuilder::merge_block(const AliasTable& block)
{
    for (const auto& [name, targets] : block.entries())
        for (const auto& t : targets) block_.add(name, t);
}

void AliasTableBuilder::add_default(const std::string& name,
                                    const std::string& target)
{
    defaults_.add(name, target);
}

void AliasTableBuilder::add_defaults(const AliasTable& defaults)
{
    for (const auto& [name, targets] : defaults.entries())
        for (const auto& t : targets) defaults_.add(name, t);
}

AliasTable AliasTableBuilder::build() const
{
    AliasTable out;
    for (const auto& [name, targets] : block_.entries())
        for (const auto& t : targets) out.add(name, t);
    for (const auto& [name, targets] : defaults_.entries())
        for (const auto& t : targets) out.add(name, t);
    return out;
}

} // namespace ecmsio
