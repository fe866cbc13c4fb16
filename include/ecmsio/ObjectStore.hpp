#pragma once
#include "Series.hpp"

#include <ankerl/unordered_dense.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ecmsio {

using DataObjectPtr = std::shared_ptr<const DataObject>;

/*
 * Backend that materialises stored objects by id.  The storage engine
 * itself lives outside this library; readers and Spectrum only need
 * this one call.
 */
class ObjectStore
{
public:
    virtual ~ObjectStore() = default;
    virtual DataObjectPtr load(ObjectId id) const = 0;
};

/* --------------------------------------------------------------------- */
/*  In-process store: objects staged before persistence, or test data.   */
/* --------------------------------------------------------------------- */
class MemoryStore : public ObjectStore
{
public:
    void put(DataObjectPtr obj);
    DataObjectPtr load(ObjectId id) const override;

    std::size_t size() const { return objects_.size(); }
    std::size_t load_count() const { return loads_; }

private:
    ankerl::unordered_dense::map<ObjectId, DataObjectPtr> objects_;
    mutable std::size_t loads_ = 0;
};

/*
 * Reference to an object that may not be loaded yet.
 *
 *   Unresolved{id, type}  --resolve(store)-->  Resolved{value}
 *
 * The transition happens once; later calls return the cached value and
 * never touch the store again.  `check` runs on the loaded object before
 * it is cached; if it throws, the reference stays Unresolved.
 * Single-threaded use only.
 */
template<typename T>
class LazyRef
{
public:
    struct Unresolved { ObjectId id; std::string type; };
    using Resolved = std::shared_ptr<const T>;

    LazyRef(ObjectId id, std::string type_name)
        : state_(Unresolved{id, std::move(type_name)}) {}
    LazyRef(Resolved value) : state_(std::move(value))
    {
        if (!std::get<Resolved>(state_))
            throw std::invalid_argument("LazyRef: null resolved value");
    }

    bool is_resolved() const { return std::holds_alternative<Resolved>(state_); }

    ObjectId id() const
    {
        if (is_resolved()) return std::get<Resolved>(state_)->id();
        return std::get<Unresolved>(state_).id;
    }

    const Resolved& resolve(const ObjectStore& store,
                            const std::function<void(const T&)>& check = {})
    {
        if (!is_resolved()) {
            const Unresolved ref = std::get<Unresolved>(state_);
            DataObjectPtr obj = store.load(ref.id);
            auto typed = std::dynamic_pointer_cast<const T>(obj);
            if (!typed)
                throw std::runtime_error(
                    "LazyRef: object " + std::to_string(ref.id) +
                    " is not a " + ref.type +
                    (obj ? std::string(" (got ") + obj->kind() + ")" : ""));
            if (check) check(*typed);
            state_ = std::move(typed);
        }
        return std::get<Resolved>(state_);
    }

    // only valid once resolved
    const Resolved& get() const
    {
        if (!is_resolved())
            throw std::runtime_error(
                "LazyRef: " + std::get<Unresolved>(state_).type + " " +
                std::to_string(std::get<Unresolved>(state_).id) +
                " accessed before it was loaded");
        return std::get<Resolved>(state_);
    }

private:
    std::variant<Unresolved, Resolved> state_;
};

} // namespace ecmsio
