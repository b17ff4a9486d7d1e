/*
 * PyObject.cpp
 *
 *  Created on: October 2026
 *
 *  This file implements the object itself: construction, kind checks and
 *  coercions, the own attribute table and the rendering entry point.
 */

#include "../headers/pycore_internal.h"
#include <algorithm>

namespace pycore
{
    const char* kindName(int tag)
    {
        switch (tag)
        {
        case KIND_STRING: return "str";
        case KIND_INTEGER: return "int";
        case KIND_BOOLEAN: return "bool";
        case KIND_LIST: return "list";
        case KIND_TUPLE: return "tuple";
        case KIND_DICT: return "dict";
        case KIND_ITERATOR: return "iterator";
        case KIND_SLICE: return "slice";
        case KIND_NAME_ERROR: return "NameError";
        case KIND_CODE: return "code";
        case KIND_FUNCTION: return "function";
        case KIND_MODULE: return "module";
        case KIND_NONE: return "NoneType";
        case KIND_CLASS: return "type";
        case KIND_NATIVE_FUNCTION: return "native_function";
        default: return "object";
        }
    }

    /**
     * @brief Constructs an object with an empty attribute table.
     * Only reachable through PyObject::create.
     */
    PyObject::PyObject(std::unique_ptr<Kind> kind, const PyObjectRef& type)
        : kind(std::move(kind)), type(type), borrowState(0)
    {
    }

    PyObject::~PyObject() = default;

    PyObjectRef PyObject::create(std::unique_ptr<Kind> kind, const PyObjectRef& type)
    {
        if (!kind) throw std::invalid_argument("PyObject::create requires a kind.");
        return PyObjectRef(std::shared_ptr<PyObject>(new PyObject(std::move(kind), type)));
    }

    int PyObject::getKindTag() const { return this->kind->getTag(); }
    const Kind& PyObject::getKind() const { return *this->kind; }
    Kind& PyObject::getKind() { return *this->kind; }
    const char* PyObject::getTypeName() const { return kindName(this->kind->getTag()); }
    const PyObjectRef& PyObject::getType() const { return this->type; }

    bool PyObject::isString() const { return getKindTag() == KIND_STRING; }
    bool PyObject::isInteger() const { return getKindTag() == KIND_INTEGER; }
    bool PyObject::isBoolean() const { return getKindTag() == KIND_BOOLEAN; }
    bool PyObject::isList() const { return getKindTag() == KIND_LIST; }
    bool PyObject::isTuple() const { return getKindTag() == KIND_TUPLE; }
    bool PyObject::isDict() const { return getKindTag() == KIND_DICT; }
    bool PyObject::isIterator() const { return getKindTag() == KIND_ITERATOR; }
    bool PyObject::isSlice() const { return getKindTag() == KIND_SLICE; }
    bool PyObject::isNameError() const { return getKindTag() == KIND_NAME_ERROR; }
    bool PyObject::isCode() const { return getKindTag() == KIND_CODE; }
    bool PyObject::isFunction() const { return getKindTag() == KIND_FUNCTION; }
    bool PyObject::isModule() const { return getKindTag() == KIND_MODULE; }
    bool PyObject::isNone() const { return getKindTag() == KIND_NONE; }
    bool PyObject::isClass() const { return getKindTag() == KIND_CLASS; }
    bool PyObject::isNativeFunction() const { return getKindTag() == KIND_NATIVE_FUNCTION; }
    bool PyObject::isCallable() const { return isNativeFunction() || isFunction(); }

    const std::string& PyObject::asString() const
    {
        if (!isString()) throw std::runtime_error("Object is not a string type.");
        return kindOf<StringKind>(*this).value;
    }

    int PyObject::asInteger() const
    {
        if (!isInteger()) throw std::runtime_error("Object is not an integer type.");
        return kindOf<IntegerKind>(*this).value;
    }

    bool PyObject::asBoolean() const
    {
        if (!isBoolean()) throw std::runtime_error("Object is not a boolean type.");
        return kindOf<BooleanKind>(*this).value;
    }

    const PyObjectList& PyObject::asList() const
    {
        if (!isList()) throw std::runtime_error("Object is not a list type.");
        return kindOf<ListKind>(*this).elements;
    }

    PyObjectList& PyObject::asList()
    {
        if (!isList()) throw std::runtime_error("Object is not a list type.");
        return kindOf<ListKind>(*this).elements;
    }

    const PyObjectList& PyObject::asTuple() const
    {
        if (!isTuple()) throw std::runtime_error("Object is not a tuple type.");
        return kindOf<TupleKind>(*this).elements;
    }

    const PyObjectDict& PyObject::asDict() const
    {
        if (!isDict()) throw std::runtime_error("Object is not a dict type.");
        return kindOf<DictKind>(*this).elements;
    }

    PyObjectDict& PyObject::asDict()
    {
        if (!isDict()) throw std::runtime_error("Object is not a dict type.");
        return kindOf<DictKind>(*this).elements;
    }

    const std::string& PyObject::getName() const
    {
        switch (getKindTag())
        {
        case KIND_CLASS: return kindOf<ClassKind>(*this).name;
        case KIND_MODULE: return kindOf<ModuleKind>(*this).name;
        case KIND_NAME_ERROR: return kindOf<NameErrorKind>(*this).name;
        default: throw std::runtime_error("Object has no name.");
        }
    }

    PyNativeFunction PyObject::asNativeFunction() const
    {
        if (!isNativeFunction()) throw std::runtime_error("Object is not a native function.");
        return kindOf<NativeFunctionKind>(*this).function;
    }

    const std::shared_ptr<const PyCodeBlob>& PyObject::asCodeBlob() const
    {
        if (isCode()) return kindOf<CodeKind>(*this).blob;
        if (isFunction()) return kindOf<FunctionKind>(*this).blob;
        throw std::runtime_error("Object carries no compiled code.");
    }

    unsigned long PyObject::getIteratorPosition() const
    {
        if (!isIterator()) throw std::runtime_error("Object is not an iterator.");
        return kindOf<IteratorKind>(*this).position;
    }

    const PyObjectRef& PyObject::getIteratorTarget() const
    {
        if (!isIterator()) throw std::runtime_error("Object is not an iterator.");
        return kindOf<IteratorKind>(*this).target;
    }

    //- Own attribute table

    bool PyObject::hasOwnAttribute(const std::string& name) const
    {
        return this->attributes.find(name) != this->attributes.end();
    }

    PyObjectRef PyObject::getOwnAttribute(const std::string& name) const
    {
        auto it = this->attributes.find(name);
        return it == this->attributes.end() ? PyObjectRef() : it->second;
    }

    void PyObject::setOwnAttribute(const std::string& name, const PyObjectRef& value)
    {
        if (!value) throw std::invalid_argument("Attribute value cannot be a null reference.");
        this->attributes[name] = value;
    }

    bool PyObject::removeOwnAttribute(const std::string& name)
    {
        return this->attributes.erase(name) > 0;
    }

    const PyObjectDict& PyObject::getOwnAttributes() const
    {
        return this->attributes;
    }

    //- Rendering

    std::string PyObject::str() const
    {
        std::string out;
        std::vector<const PyObject*> visiting;
        this->renderTo(out, visiting);
        return out;
    }

    /**
     * @brief Renders this object, guarding against containers that reach themselves.
     * A nested occurrence of an object already being rendered prints as an ellipsis
     * in the bracket style of its kind.
     */
    void PyObject::renderTo(std::string& out, std::vector<const PyObject*>& visiting) const
    {
        if (std::find(visiting.begin(), visiting.end(), this) != visiting.end()) {
            switch (getKindTag())
            {
            case KIND_LIST: out += "[...]"; break;
            case KIND_ITERATOR: out += "<iter ...>"; break;
            default: out += "{...}"; break;
            }
            return;
        }
        visiting.push_back(this);
        this->kind->render(out, visiting);
        visiting.pop_back();
    }
}
