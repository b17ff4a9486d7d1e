/*
 * PyIterator.cpp
 *
 *  Created on: October 2026
 *
 *  The iterator protocol. An iterator is a cursor over the live state of
 *  its target: the target's length is read on every step, so mutations made
 *  during iteration are observed.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    /**
     * @brief Returns the next element, or an exhausted result once the cursor
     * reached the end of the target.
     *
     * Exhaustion is terminal: once reported, later calls report it again even
     * if the target has grown in the meantime.
     */
    PyResult PyObjectRef::advance(PyContext* context) const
    {
        PyWriteGuard iterator = this->borrowMut();
        if (!iterator->isIterator()) {
            return context->fail(ERROR_UNSUPPORTED_ITERATION,
                std::string("'") + iterator->getTypeName() + "' object is not an iterator");
        }

        IteratorKind& cursor = kindOf<IteratorKind>(*iterator);
        PyReadGuard target = cursor.target.borrow();

        const PyObjectList* elements;
        switch (target->getKindTag())
        {
        case KIND_LIST: elements = &target->asList(); break;
        case KIND_TUPLE: elements = &target->asTuple(); break;
        default:
            return context->fail(ERROR_UNSUPPORTED_ITERATION,
                std::string("'") + target->getTypeName() + "' object is not iterable");
        }

        if (cursor.exhausted || cursor.position >= elements->size()) {
            cursor.exhausted = true;
            return PyResult::exhausted();
        }
        const PyObjectRef element = (*elements)[cursor.position];
        ++cursor.position;
        return PyResult::success(element);
    }
}
