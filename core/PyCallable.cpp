/*
 * PyCallable.cpp
 *
 *  Created on: October 2026
 *
 *  The callable protocol. Native functions are called directly with the
 *  executor capability; interpreted functions are handed back to the
 *  executor, which owns the evaluation loop.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    PyResult PyObjectRef::invoke(PyExecutor* executor, const PyObjectList& args) const
    {
        if (!executor) throw std::invalid_argument("invoke requires an executor.");
        PyContext* context = executor->getContext();

        PyNativeFunction function = nullptr;
        {
            PyReadGuard callable = this->borrow();
            switch (callable->getKindTag())
            {
            case KIND_NATIVE_FUNCTION:
                function = callable->asNativeFunction();
                break;
            case KIND_FUNCTION:
                break;
            default:
                return context->fail(ERROR_NOT_CALLABLE,
                    std::string("'") + callable->getTypeName() + "' object is not callable");
            }
        }

        // The callee runs with no borrow held on the callable.
        if (!function) {
            return executor->call(*this, args);
        }
        return function(executor, args);
    }
}
