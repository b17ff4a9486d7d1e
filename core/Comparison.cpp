/*
 * Comparison.cpp
 *
 *  Created on: October 2026
 *
 *  Equality and ordering. Both are per-kind capabilities checked before
 *  dispatch; an unsupported pairing is a TypeError, never a guessed answer.
 */

#include "../headers/pycore_internal.h"
#include <algorithm>
#include <utility>

namespace pycore
{
    namespace
    {
        PyResult incomparable(PyContext* context, const char* what, const PyObject& left, const PyObject& right)
        {
            return context->fail(ERROR_TYPE,
                std::string(what) + " not supported between instances of '" +
                left.getTypeName() + "' and '" + right.getTypeName() + "'");
        }

        //! Pairs of objects whose comparison is in progress, outermost first.
        typedef std::vector<std::pair<const PyObject*, const PyObject*>> ComparisonStack;

        int equalityOf(PyContext* context, const PyObject& left, const PyObject& right, PyResult& failure, ComparisonStack& comparing);

        /**
         * @brief Element-wise list equality. A pair of lists already being compared
         * further up counts as equal, so self-containing lists terminate.
         */
        int testListEquality(PyContext* context, const PyObject& left, const PyObject& right, PyResult& failure, ComparisonStack& comparing)
        {
            const std::pair<const PyObject*, const PyObject*> pair(&left, &right);
            if (std::find(comparing.begin(), comparing.end(), pair) != comparing.end()) return 1;

            const PyObjectList& l = left.asList();
            const PyObjectList& r = right.asList();
            if (l.size() != r.size()) return 0;

            comparing.push_back(pair);
            int result = 1;
            for (unsigned long i = 0; i < l.size() && result == 1; ++i) {
                PyReadGuard le = l[i].borrow();
                PyReadGuard re = r[i].borrow();
                result = equalityOf(context, *le, *re, failure, comparing);
            }
            comparing.pop_back();
            return result;
        }

        int equalityOf(PyContext* context, const PyObject& left, const PyObject& right, PyResult& failure, ComparisonStack& comparing)
        {
            const int tag = left.getKindTag();
            if (tag != right.getKindTag() || !isEquatable(tag)) {
                failure = incomparable(context, "'=='", left, right);
                return -1;
            }
            if (&left == &right) return 1;

            switch (tag)
            {
            case KIND_INTEGER: return left.asInteger() == right.asInteger() ? 1 : 0;
            case KIND_STRING: return left.asString() == right.asString() ? 1 : 0;
            case KIND_LIST: return testListEquality(context, left, right, failure, comparing);
            default:
                failure = incomparable(context, "'=='", left, right);
                return -1;
            }
        }

        int orderingOutcome(PyContext* context, const PyObjectRef& left, const PyObjectRef& right, PyResult& failure)
        {
            PyReadGuard l = left.borrow();
            PyReadGuard r = right.borrow();
            int order = 0;
            if (testOrder(context, *l, *r, order, failure) < 0) return -2;
            return order;
        }
    }

    bool isEquatable(int tag)
    {
        return tag == KIND_INTEGER || tag == KIND_STRING || tag == KIND_LIST;
    }

    bool isOrderable(int tag)
    {
        return tag == KIND_INTEGER;
    }

    int testEquality(PyContext* context, const PyObject& left, const PyObject& right, PyResult& failure)
    {
        ComparisonStack comparing;
        return equalityOf(context, left, right, failure, comparing);
    }

    int testOrder(PyContext* context, const PyObject& left, const PyObject& right, int& order, PyResult& failure)
    {
        const int tag = left.getKindTag();
        if (tag != right.getKindTag() || !isOrderable(tag)) {
            failure = incomparable(context, "ordering", left, right);
            return -1;
        }
        order = Integer::compare(left.asInteger(), right.asInteger());
        return 1;
    }

    //- PyObjectRef comparison API

    PyResult PyObjectRef::equals(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        PyReadGuard l = this->borrow();
        PyReadGuard r = other.borrow();
        const int equal = testEquality(context, *l, *r, failure);
        if (equal < 0) return failure;
        return PyResult::success(context->newBoolean(equal == 1));
    }

    PyResult PyObjectRef::notEquals(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        PyReadGuard l = this->borrow();
        PyReadGuard r = other.borrow();
        const int equal = testEquality(context, *l, *r, failure);
        if (equal < 0) return failure;
        return PyResult::success(context->newBoolean(equal == 0));
    }

    PyResult PyObjectRef::lessThan(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        const int order = orderingOutcome(context, *this, other, failure);
        if (order == -2) return failure;
        return PyResult::success(context->newBoolean(order < 0));
    }

    PyResult PyObjectRef::lessOrEqual(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        const int order = orderingOutcome(context, *this, other, failure);
        if (order == -2) return failure;
        return PyResult::success(context->newBoolean(order <= 0));
    }

    PyResult PyObjectRef::greaterThan(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        const int order = orderingOutcome(context, *this, other, failure);
        if (order == -2) return failure;
        return PyResult::success(context->newBoolean(order > 0));
    }

    PyResult PyObjectRef::greaterOrEqual(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        const int order = orderingOutcome(context, *this, other, failure);
        if (order == -2) return failure;
        return PyResult::success(context->newBoolean(order >= 0));
    }

    PyResult PyObjectRef::compare(PyContext* context, const PyObjectRef& other) const
    {
        PyResult failure;
        const int order = orderingOutcome(context, *this, other, failure);
        if (order == -2) return failure;
        return PyResult::success(context->newInteger(order));
    }
}
