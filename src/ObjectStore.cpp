#include "ecmsio/ObjectStore.hpp"

namespace ecmsio {

void MemoryStore::put(DataObjectPtr obj)
{
    if (!obj) throw std::invalid_argument("MemoryStore::put: null object");
    const ObjectId id = obj->id();
    objects_.insert_or_assign(id, std::move(obj));
}

DataObjectPtr MemoryStore::load(ObjectId id) const
{
    ++loads_;
    auto it = objects_.find(id);
    if (it == objects_.end())
        throw std::runtime_error("MemoryStore: no object with id " +
                                 std::to_string(id));
    return it->second;
}

} // namespace ecmsio
