/*
 * Attributes.cpp
 *
 *  Created on: October 2026
 *
 *  Attribute access through the open attribute table. Lookup checks the
 *  object itself, then walks its type links until the chain ends at the
 *  root `type` object. This stands in for a full method resolution order.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    namespace
    {
        /** Own attribute first, then along the type chain. Null when missing. */
        PyObjectRef lookupAttribute(const PyObjectRef& start, const std::string& name)
        {
            PyObjectRef current = start;
            while (current) {
                PyObjectRef next;
                {
                    PyReadGuard guard = current.borrow();
                    PyObjectRef found = guard->getOwnAttribute(name);
                    if (found) return found;
                    next = guard->getType();
                }
                current = next;
            }
            return PyObjectRef();
        }
    }

    PyResult PyObjectRef::getAttribute(PyContext* context, const std::string& name) const
    {
        PyObjectRef found = lookupAttribute(*this, name);
        if (found) return PyResult::success(found);

        std::string typeName;
        {
            PyReadGuard guard = this->borrow();
            typeName = guard->getTypeName();
        }
        return context->fail(ERROR_ATTRIBUTE, "'" + typeName + "' object has no attribute '" + name + "'");
    }

    void PyObjectRef::setAttribute(const std::string& name, const PyObjectRef& value) const
    {
        PyWriteGuard guard = this->borrowMut();
        guard->setOwnAttribute(name, value);
    }

    bool PyObjectRef::hasAttribute(const std::string& name) const
    {
        return static_cast<bool>(lookupAttribute(*this, name));
    }

    PyResult PyObjectRef::deleteAttribute(PyContext* context, const std::string& name) const
    {
        std::string typeName;
        {
            PyWriteGuard guard = this->borrowMut();
            if (guard->removeOwnAttribute(name)) return PyResult::success(context->getNone());
            typeName = guard->getTypeName();
        }
        return context->fail(ERROR_ATTRIBUTE, "'" + typeName + "' object has no attribute '" + name + "'");
    }
}
