/*
 * Containers.cpp
 *
 *  Created on: October 2026
 *
 *  Subscripting, length, append and membership over the container kinds.
 *  Indices follow Python rules: negative positions count from the end and
 *  slices are clamped to the sequence.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    namespace
    {
        bool normalizeIndex(long long index, unsigned long length, unsigned long& position)
        {
            if (index < 0) index += static_cast<long long>(length);
            if (index < 0 || index >= static_cast<long long>(length)) return false;
            position = static_cast<unsigned long>(index);
            return true;
        }

        long long clampBound(long long value, long long length, long long lower, long long upper)
        {
            if (value < 0) {
                value += length;
                return value < lower ? lower : value;
            }
            return value > upper ? upper : value;
        }

        /** Fills \a indices with the positions selected by \a slice. False when the step is zero. */
        bool sliceIndices(const SliceKind& slice, unsigned long size, std::vector<unsigned long>& indices)
        {
            const long long length = static_cast<long long>(size);
            const long long step = slice.step.present ? slice.step.value : 1;
            if (step == 0) return false;

            const long long lower = step < 0 ? -1 : 0;
            const long long upper = step < 0 ? length - 1 : length;
            const long long start = slice.start.present ? clampBound(slice.start.value, length, lower, upper) : (step < 0 ? upper : lower);
            const long long stop = slice.stop.present ? clampBound(slice.stop.value, length, lower, upper) : (step < 0 ? lower : upper);

            for (long long i = start; step > 0 ? i < stop : i > stop; i += step) {
                indices.push_back(static_cast<unsigned long>(i));
            }
            return true;
        }

        PyResult zeroStep(PyContext* context)
        {
            return context->fail(ERROR_VALUE, "slice step cannot be zero");
        }

        PyResult badIndexType(PyContext* context, const PyObject& container, const PyObject& key)
        {
            if (container.isDict()) {
                return context->fail(ERROR_TYPE, std::string("dict keys must be str, not '") + key.getTypeName() + "'");
            }
            return context->fail(ERROR_TYPE,
                std::string("'") + container.getTypeName() + "' indices must be integers or slices, not '" + key.getTypeName() + "'");
        }

        PyResult notSubscriptable(PyContext* context, const PyObject& container)
        {
            return context->fail(ERROR_TYPE, std::string("'") + container.getTypeName() + "' object is not subscriptable");
        }

        PyResult getSequenceItem(PyContext* context, const PyObject& container, const PyObjectList& elements, const PyObject& key)
        {
            if (key.isInteger()) {
                unsigned long position;
                if (!normalizeIndex(key.asInteger(), elements.size(), position)) {
                    return context->fail(ERROR_INDEX, std::string(container.getTypeName()) + " index out of range");
                }
                return PyResult::success(elements[position]);
            }
            if (key.isSlice()) {
                std::vector<unsigned long> indices;
                if (!sliceIndices(kindOf<SliceKind>(key), elements.size(), indices)) return zeroStep(context);
                PyObjectList selected;
                selected.reserve(indices.size());
                for (unsigned long position : indices) {
                    selected.push_back(elements[position]);
                }
                return PyResult::success(container.isList() ? context->newList(selected) : context->newTuple(selected));
            }
            return badIndexType(context, container, key);
        }

        PyResult getStringItem(PyContext* context, const PyObject& container, const PyObject& key)
        {
            const std::string& text = container.asString();
            if (key.isInteger()) {
                unsigned long position;
                if (!normalizeIndex(key.asInteger(), text.size(), position)) {
                    return context->fail(ERROR_INDEX, "string index out of range");
                }
                return PyResult::success(context->newString(text.substr(position, 1)));
            }
            if (key.isSlice()) {
                std::vector<unsigned long> indices;
                if (!sliceIndices(kindOf<SliceKind>(key), text.size(), indices)) return zeroStep(context);
                std::string selected;
                selected.reserve(indices.size());
                for (unsigned long position : indices) {
                    selected += text[position];
                }
                return PyResult::success(context->newString(selected));
            }
            return badIndexType(context, container, key);
        }

        PyResult sizeOf(PyContext* context, unsigned long size)
        {
            if (size > static_cast<unsigned long>(INT_MAX)) {
                return context->fail(ERROR_OVERFLOW, "length does not fit in an integer");
            }
            return PyResult::success(context->newInteger(static_cast<int>(size)));
        }
    }

    PyResult PyObjectRef::getItem(PyContext* context, const PyObjectRef& key) const
    {
        PyReadGuard container = this->borrow();
        PyReadGuard index = key.borrow();

        switch (container->getKindTag())
        {
        case KIND_LIST: return getSequenceItem(context, *container, container->asList(), *index);
        case KIND_TUPLE: return getSequenceItem(context, *container, container->asTuple(), *index);
        case KIND_STRING: return getStringItem(context, *container, *index);
        case KIND_DICT:
        {
            if (!index->isString()) return badIndexType(context, *container, *index);
            const PyObjectDict& elements = container->asDict();
            auto it = elements.find(index->asString());
            if (it == elements.end()) return context->fail(ERROR_KEY, "'" + index->asString() + "'");
            return PyResult::success(it->second);
        }
        default:
            return notSubscriptable(context, *container);
        }
    }

    PyResult PyObjectRef::setItem(PyContext* context, const PyObjectRef& key, const PyObjectRef& value) const
    {
        if (!value) throw std::invalid_argument("setItem requires a value.");

        int keyTag;
        int position = 0;
        std::string name;
        {
            PyReadGuard index = key.borrow();
            keyTag = index->getKindTag();
            if (keyTag == KIND_INTEGER) position = index->asInteger();
            else if (keyTag == KIND_STRING) name = index->asString();
        }

        PyWriteGuard container = this->borrowMut();
        switch (container->getKindTag())
        {
        case KIND_LIST:
        {
            if (keyTag != KIND_INTEGER) {
                return context->fail(ERROR_TYPE, std::string("list indices must be integers, not '") + kindName(keyTag) + "'");
            }
            PyObjectList& elements = container->asList();
            unsigned long slot;
            if (!normalizeIndex(position, elements.size(), slot)) {
                return context->fail(ERROR_INDEX, "list assignment index out of range");
            }
            elements[slot] = value;
            return PyResult::success(context->getNone());
        }
        case KIND_DICT:
            if (keyTag != KIND_STRING) {
                return context->fail(ERROR_TYPE, std::string("dict keys must be str, not '") + kindName(keyTag) + "'");
            }
            container->asDict()[name] = value;
            return PyResult::success(context->getNone());
        default:
            return context->fail(ERROR_TYPE,
                std::string("'") + container->getTypeName() + "' object does not support item assignment");
        }
    }

    PyResult PyObjectRef::length(PyContext* context) const
    {
        PyReadGuard guard = this->borrow();
        switch (guard->getKindTag())
        {
        case KIND_STRING: return sizeOf(context, guard->asString().size());
        case KIND_LIST: return sizeOf(context, guard->asList().size());
        case KIND_TUPLE: return sizeOf(context, guard->asTuple().size());
        case KIND_DICT: return sizeOf(context, guard->asDict().size());
        default:
            return context->fail(ERROR_TYPE, std::string("object of type '") + guard->getTypeName() + "' has no len()");
        }
    }

    PyResult PyObjectRef::append(PyContext* context, const PyObjectRef& value) const
    {
        if (!value) throw std::invalid_argument("append requires a value.");
        PyWriteGuard guard = this->borrowMut();
        if (!guard->isList()) {
            return context->fail(ERROR_TYPE, std::string("'") + guard->getTypeName() + "' object has no attribute 'append'");
        }
        guard->asList().push_back(value);
        return PyResult::success(context->getNone());
    }

    /**
     * @brief Membership test. Sequence elements of another kind than \a value are
     * skipped rather than compared, so mixed lists can still be searched.
     *
     * This is membership semantics, not equality: equals() on the same mixed
     * pair still fails with a TypeError.
     */
    PyResult PyObjectRef::contains(PyContext* context, const PyObjectRef& value) const
    {
        PyReadGuard container = this->borrow();
        PyReadGuard needle = value.borrow();

        const PyObjectList* elements = nullptr;
        switch (container->getKindTag())
        {
        case KIND_LIST: elements = &container->asList(); break;
        case KIND_TUPLE: elements = &container->asTuple(); break;
        case KIND_DICT:
            if (!needle->isString()) {
                return context->fail(ERROR_TYPE, std::string("dict keys must be str, not '") + needle->getTypeName() + "'");
            }
            return PyResult::success(context->newBoolean(container->asDict().count(needle->asString()) > 0));
        case KIND_STRING:
            if (!needle->isString()) {
                return context->fail(ERROR_TYPE,
                    std::string("'in <string>' requires string as left operand, not '") + needle->getTypeName() + "'");
            }
            return PyResult::success(context->newBoolean(container->asString().find(needle->asString()) != std::string::npos));
        default:
            return context->fail(ERROR_TYPE, std::string("argument of type '") + container->getTypeName() + "' is not iterable");
        }

        const int tag = needle->getKindTag();
        for (const PyObjectRef& element : *elements) {
            if (element.isSameObject(value)) return PyResult::success(context->newBoolean(true));
            PyReadGuard candidate = element.borrow();
            if (candidate->getKindTag() != tag || !isEquatable(tag)) continue;
            PyResult failure;
            const int equal = testEquality(context, *candidate, *needle, failure);
            if (equal < 0) return failure;
            if (equal == 1) return PyResult::success(context->newBoolean(true));
        }
        return PyResult::success(context->newBoolean(false));
    }
}
