/*
 * PyContext.cpp
 *
 *  Created on: October 2026
 *
 *  This file implements the PyContext: bootstrap of the canonical type
 *  objects, the value factories and the diagnostics hooks.
 */

#include "../headers/pycore_internal.h"
#include <iostream>

namespace pycore
{
    /**
     * @brief Bootstraps the canonical type objects.
     *
     * `type` is built first and carries no type link of its own: a self link
     * would be a reference cycle that counting never reclaims. Every other
     * canonical type is a class whose type link is `type`.
     */
    PyContext::PyContext() :
        maxStringLength(64UL * 1024UL * 1024UL),
        traceLevel(TRACE_SILENT),
        binaryOperatorFallback(nullptr),
        failureCallback(nullptr)
    {
        this->typeType = PyObject::create(std::make_unique<ClassKind>("type"), PyObjectRef());

        this->integerType = newClass("int");
        this->stringType = newClass("str");
        this->booleanType = newClass("bool");
        this->listType = newClass("list");
        this->tupleType = newClass("tuple");
        this->dictType = newClass("dict");
        this->iteratorType = newClass("iterator");
        this->sliceType = newClass("slice");
        this->nameErrorType = newClass("NameError");
        this->codeType = newClass("code");
        this->functionType = newClass("function");
        this->moduleType = newClass("module");
        this->noneType = newClass("NoneType");
        this->nativeFunctionType = newClass("native_function");

        this->noneObject = PyObject::create(std::make_unique<NoneKind>(), this->noneType);
    }

    PyContext::~PyContext() = default;

    //- Primitive factories

    PyObjectRef PyContext::newInteger(int value)
    {
        return PyObject::create(std::make_unique<IntegerKind>(value), this->integerType);
    }

    PyObjectRef PyContext::newString(const std::string& value)
    {
        return PyObject::create(std::make_unique<StringKind>(value), this->stringType);
    }

    PyObjectRef PyContext::newBoolean(bool value)
    {
        return PyObject::create(std::make_unique<BooleanKind>(value), this->booleanType);
    }

    PyObjectRef PyContext::newNameError(const std::string& name)
    {
        return PyObject::create(std::make_unique<NameErrorKind>(name), this->nameErrorType);
    }

    PyObjectRef PyContext::newSlice(const int* start, const int* stop, const int* step)
    {
        SliceBound startBound{start != nullptr, start ? *start : 0};
        SliceBound stopBound{stop != nullptr, stop ? *stop : 0};
        SliceBound stepBound{step != nullptr, step ? *step : 0};
        return PyObject::create(std::make_unique<SliceKind>(startBound, stopBound, stepBound), this->sliceType);
    }

    //- Container factories

    PyObjectRef PyContext::newList(const PyObjectList& elements)
    {
        for (const auto& element : elements) {
            if (!element) throw std::invalid_argument("List elements cannot be null references.");
        }
        return PyObject::create(std::make_unique<ListKind>(elements), this->listType);
    }

    PyObjectRef PyContext::newTuple(const PyObjectList& elements)
    {
        for (const auto& element : elements) {
            if (!element) throw std::invalid_argument("Tuple elements cannot be null references.");
        }
        return PyObject::create(std::make_unique<TupleKind>(elements), this->tupleType);
    }

    PyObjectRef PyContext::newDict(const PyObjectDict& elements)
    {
        for (const auto& entry : elements) {
            if (!entry.second) throw std::invalid_argument("Dict values cannot be null references.");
        }
        return PyObject::create(std::make_unique<DictKind>(elements), this->dictType);
    }

    PyObjectRef PyContext::newIterator(const PyObjectRef& target)
    {
        if (!target) throw std::invalid_argument("An iterator needs a target.");
        return PyObject::create(std::make_unique<IteratorKind>(target), this->iteratorType);
    }

    PyResult PyContext::getIterator(const PyObjectRef& target)
    {
        int tag;
        {
            PyReadGuard guard = target.borrow();
            tag = guard->getKindTag();
        }
        if (tag != KIND_LIST && tag != KIND_TUPLE) {
            return fail(ERROR_UNSUPPORTED_ITERATION, std::string("'") + kindName(tag) + "' object is not iterable");
        }
        return PyResult::success(newIterator(target));
    }

    //- Code, callables and namespaces

    PyObjectRef PyContext::newCode(const std::shared_ptr<const PyCodeBlob>& blob)
    {
        if (!blob) throw std::invalid_argument("A code object needs a compiled blob.");
        return PyObject::create(std::make_unique<CodeKind>(blob), this->codeType);
    }

    PyObjectRef PyContext::newFunction(const std::shared_ptr<const PyCodeBlob>& blob)
    {
        if (!blob) throw std::invalid_argument("A function needs a compiled blob.");
        return PyObject::create(std::make_unique<FunctionKind>(blob), this->functionType);
    }

    PyObjectRef PyContext::newNativeFunction(PyNativeFunction function)
    {
        if (!function) throw std::invalid_argument("A native function needs a target.");
        return PyObject::create(std::make_unique<NativeFunctionKind>(function), this->nativeFunctionType);
    }

    PyObjectRef PyContext::newModule(const std::string& name)
    {
        return PyObject::create(std::make_unique<ModuleKind>(name), this->moduleType);
    }

    PyObjectRef PyContext::newClass(const std::string& name)
    {
        return PyObject::create(std::make_unique<ClassKind>(name), this->typeType);
    }

    const PyObjectRef& PyContext::getNone() const
    {
        return this->noneObject;
    }

    //- Diagnostics

    PyResult PyContext::fail(int kind, const std::string& message, const PyObjectRef& payload)
    {
        PyError error(kind, message, payload);
        this->trace(TRACE_FAILURES, error.toString());
        if (this->failureCallback) {
            this->failureCallback(this, error);
        }
        return PyResult::failure(error);
    }

    void PyContext::trace(int level, const std::string& message) const
    {
        if (level > this->traceLevel) return;
        std::cerr << "pyCore: " << message << std::endl;
    }
}
