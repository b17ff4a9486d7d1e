/*
 * PyObjectRef.cpp
 *
 *  Created on: October 2026
 *
 *  This file implements the shared handle and the borrow guards that enforce
 *  the exclusive-or-shared access rule on every object.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    //=========================================================================
    // PyObjectRef
    //=========================================================================

    PyObjectRef::PyObjectRef() : object(nullptr)
    {
    }

    PyObjectRef::PyObjectRef(std::shared_ptr<PyObject> object) : object(std::move(object))
    {
    }

    bool PyObjectRef::isNull() const
    {
        return !this->object;
    }

    PyObjectRef::operator bool() const
    {
        return static_cast<bool>(this->object);
    }

    bool PyObjectRef::isSameObject(const PyObjectRef& other) const
    {
        return this->object && this->object == other.object;
    }

    long PyObjectRef::getUseCount() const
    {
        return this->object.use_count();
    }

    PyReadGuard PyObjectRef::borrow() const
    {
        if (!this->object) throw std::invalid_argument("Cannot borrow a null reference.");
        return PyReadGuard(this->object);
    }

    PyWriteGuard PyObjectRef::borrowMut() const
    {
        if (!this->object) throw std::invalid_argument("Cannot borrow a null reference.");
        return PyWriteGuard(this->object);
    }

    std::string PyObjectRef::str() const
    {
        if (!this->object) return "<null>";
        PyReadGuard guard = this->borrow();
        return guard->str();
    }

    PyResult PyObjectRef::add(PyContext* context, const PyObjectRef& other) const
    {
        return dispatchBinaryOperator(context, OPERATOR_ADD, *this, other);
    }

    PyResult PyObjectRef::subtract(PyContext* context, const PyObjectRef& other) const
    {
        return dispatchBinaryOperator(context, OPERATOR_SUBTRACT, *this, other);
    }

    PyResult PyObjectRef::multiply(PyContext* context, const PyObjectRef& other) const
    {
        return dispatchBinaryOperator(context, OPERATOR_MULTIPLY, *this, other);
    }

    PyResult PyObjectRef::divide(PyContext* context, const PyObjectRef& other) const
    {
        return dispatchBinaryOperator(context, OPERATOR_DIVIDE, *this, other);
    }

    bool PyObjectRef::isTrue() const
    {
        PyReadGuard guard = this->borrow();
        switch (guard->getKindTag())
        {
        case KIND_BOOLEAN: return guard->asBoolean();
        case KIND_INTEGER: return guard->asInteger() != 0;
        case KIND_STRING: return !guard->asString().empty();
        case KIND_LIST: return !guard->asList().empty();
        case KIND_TUPLE: return !guard->asTuple().empty();
        case KIND_DICT: return !guard->asDict().empty();
        case KIND_NONE: return false;
        default: return true;
        }
    }

    //=========================================================================
    // Borrow guards
    //=========================================================================

    PyReadGuard::PyReadGuard(std::shared_ptr<PyObject> object) : object(std::move(object))
    {
        if (this->object->borrowState < 0) {
            this->object.reset();
            throw BorrowError("Object is already mutably borrowed.");
        }
        ++this->object->borrowState;
    }

    PyReadGuard::PyReadGuard(PyReadGuard&& other) noexcept : object(std::move(other.object))
    {
    }

    PyReadGuard::~PyReadGuard()
    {
        if (this->object) --this->object->borrowState;
    }

    PyWriteGuard::PyWriteGuard(std::shared_ptr<PyObject> object) : object(std::move(object))
    {
        if (this->object->borrowState != 0) {
            const bool writer = this->object->borrowState < 0;
            this->object.reset();
            throw BorrowError(writer ? "Object is already mutably borrowed." : "Object is already borrowed.");
        }
        this->object->borrowState = -1;
    }

    PyWriteGuard::PyWriteGuard(PyWriteGuard&& other) noexcept : object(std::move(other.object))
    {
    }

    PyWriteGuard::~PyWriteGuard()
    {
        if (this->object) this->object->borrowState = 0;
    }
}
