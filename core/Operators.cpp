/*
 * Operators.cpp
 *
 *  Created on: October 2026
 *
 *  Binary arithmetic as a flat table indexed by operator, left kind and
 *  right kind. An empty cell falls through to the context's
 *  binaryOperatorFallback hook, then to a TypeError.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    namespace
    {
        typedef PyResult (*BinaryHandler)(PyContext* context, const PyObject& left, const PyObject& right);

        PyResult addIntegers(PyContext* context, const PyObject& left, const PyObject& right)
        {
            int result;
            if (!Integer::add(left.asInteger(), right.asInteger(), result)) {
                return context->fail(ERROR_OVERFLOW, "integer addition overflow");
            }
            return PyResult::success(context->newInteger(result));
        }

        PyResult subtractIntegers(PyContext* context, const PyObject& left, const PyObject& right)
        {
            int result;
            if (!Integer::subtract(left.asInteger(), right.asInteger(), result)) {
                return context->fail(ERROR_OVERFLOW, "integer subtraction overflow");
            }
            return PyResult::success(context->newInteger(result));
        }

        PyResult multiplyIntegers(PyContext* context, const PyObject& left, const PyObject& right)
        {
            int result;
            if (!Integer::multiply(left.asInteger(), right.asInteger(), result)) {
                return context->fail(ERROR_OVERFLOW, "integer multiplication overflow");
            }
            return PyResult::success(context->newInteger(result));
        }

        PyResult divideIntegers(PyContext* context, const PyObject& left, const PyObject& right)
        {
            if (right.asInteger() == 0) {
                return context->fail(ERROR_DIVISION_BY_ZERO, "integer division by zero");
            }
            int result;
            if (!Integer::divide(left.asInteger(), right.asInteger(), result)) {
                return context->fail(ERROR_OVERFLOW, "integer division overflow");
            }
            return PyResult::success(context->newInteger(result));
        }

        PyResult concatenateStrings(PyContext* context, const PyObject& left, const PyObject& right)
        {
            const std::string& head = left.asString();
            const std::string& tail = right.asString();
            if (head.size() + tail.size() > context->maxStringLength) {
                return context->fail(ERROR_OVERFLOW, "string is too long");
            }
            return PyResult::success(context->newString(head + tail));
        }

        PyResult repeatString(PyContext* context, const PyObject& left, const PyObject& right)
        {
            const std::string& text = left.asString();
            const int count = right.asInteger();
            if (count <= 0 || text.empty()) {
                return PyResult::success(context->newString(std::string()));
            }
            const unsigned long long total = static_cast<unsigned long long>(text.size()) * count;
            if (total > context->maxStringLength) {
                return context->fail(ERROR_OVERFLOW, "repeated string is too long");
            }
            std::string result;
            result.reserve(total);
            for (int i = 0; i < count; ++i) {
                result += text;
            }
            return PyResult::success(context->newString(result));
        }

        PyResult concatenateLists(PyContext* context, const PyObject& left, const PyObject& right)
        {
            const PyObjectList& head = left.asList();
            const PyObjectList& tail = right.asList();
            PyObjectList elements;
            elements.reserve(head.size() + tail.size());
            elements.insert(elements.end(), head.begin(), head.end());
            elements.insert(elements.end(), tail.begin(), tail.end());
            return PyResult::success(context->newList(elements));
        }

        struct BinaryOperatorTable
        {
            BinaryHandler handlers[OPERATOR_COUNT][KIND_COUNT][KIND_COUNT];

            BinaryOperatorTable() : handlers()
            {
                handlers[OPERATOR_ADD][KIND_INTEGER][KIND_INTEGER] = addIntegers;
                handlers[OPERATOR_ADD][KIND_STRING][KIND_STRING] = concatenateStrings;
                handlers[OPERATOR_ADD][KIND_LIST][KIND_LIST] = concatenateLists;
                handlers[OPERATOR_SUBTRACT][KIND_INTEGER][KIND_INTEGER] = subtractIntegers;
                handlers[OPERATOR_MULTIPLY][KIND_INTEGER][KIND_INTEGER] = multiplyIntegers;
                handlers[OPERATOR_MULTIPLY][KIND_STRING][KIND_INTEGER] = repeatString;
                handlers[OPERATOR_DIVIDE][KIND_INTEGER][KIND_INTEGER] = divideIntegers;
            }
        };

        const BinaryOperatorTable& operatorTable()
        {
            static const BinaryOperatorTable table;
            return table;
        }
    }

    const char* operatorSymbol(int op)
    {
        switch (op)
        {
        case OPERATOR_ADD: return "+";
        case OPERATOR_SUBTRACT: return "-";
        case OPERATOR_MULTIPLY: return "*";
        case OPERATOR_DIVIDE: return "/";
        default: return "?";
        }
    }

    PyResult dispatchBinaryOperator(PyContext* context, int op, const PyObjectRef& left, const PyObjectRef& right)
    {
        if (op < 0 || op >= OPERATOR_COUNT) throw std::invalid_argument("Unknown binary operator.");

        int leftTag;
        int rightTag;
        {
            PyReadGuard l = left.borrow();
            PyReadGuard r = right.borrow();
            leftTag = l->getKindTag();
            rightTag = r->getKindTag();

            BinaryHandler handler = operatorTable().handlers[op][leftTag][rightTag];
            if (handler) {
                if (context->traceLevel >= TRACE_DISPATCH) {
                    context->trace(TRACE_DISPATCH, std::string("dispatch ") + kindName(leftTag) + " " + operatorSymbol(op) + " " + kindName(rightTag));
                }
                return handler(context, *l, *r);
            }
        }

        // Both guards are released here, the fallback may borrow either operand.
        if (context->binaryOperatorFallback) {
            PyResult result;
            if (context->binaryOperatorFallback(context, op, left, right, result)) return result;
        }

        return context->fail(ERROR_TYPE,
            std::string("unsupported operand type(s) for ") + operatorSymbol(op) + ": '" +
            kindName(leftTag) + "' and '" + kindName(rightTag) + "'");
    }
}
