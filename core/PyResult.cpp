/*
 * PyResult.cpp
 *
 *  Created on: October 2026
 *
 *  The result channel (PyResult), its failure payload (PyError) and the
 *  opaque compiled-program blob.
 */

#include "../headers/pycore_internal.h"

namespace pycore
{
    //=========================================================================
    // PyError
    //=========================================================================

    PyError::PyError() : kind(0)
    {
    }

    PyError::PyError(int kind, std::string message, PyObjectRef payload)
        : kind(kind), message(std::move(message)), payload(std::move(payload))
    {
    }

    int PyError::getKind() const
    {
        return this->kind;
    }

    const char* PyError::getKindName() const
    {
        switch (this->kind)
        {
        case ERROR_TYPE: return "TypeError";
        case ERROR_VALUE: return "ValueError";
        case ERROR_OVERFLOW: return "OverflowError";
        case ERROR_DIVISION_BY_ZERO: return "DivisionByZeroError";
        case ERROR_NOT_CALLABLE: return "NotCallableError";
        case ERROR_UNSUPPORTED_ITERATION: return "UnsupportedIterationError";
        case ERROR_ATTRIBUTE: return "AttributeError";
        case ERROR_INDEX: return "IndexError";
        case ERROR_KEY: return "KeyError";
        case ERROR_EXCEPTION: return "Exception";
        default: return "Error";
        }
    }

    const std::string& PyError::getMessage() const
    {
        return this->message;
    }

    const PyObjectRef& PyError::getPayload() const
    {
        return this->payload;
    }

    std::string PyError::toString() const
    {
        return std::string(getKindName()) + ": " + this->message;
    }

    //=========================================================================
    // PyResult
    //=========================================================================

    PyResult::PyResult() : state(RESULT_EXHAUSTED)
    {
    }

    PyResult PyResult::success(const PyObjectRef& value)
    {
        if (!value) throw std::invalid_argument("A successful result needs a value.");
        PyResult result;
        result.state = RESULT_SUCCESS;
        result.value = value;
        return result;
    }

    PyResult PyResult::failure(const PyError& error)
    {
        PyResult result;
        result.state = RESULT_FAILURE;
        result.error = error;
        return result;
    }

    PyResult PyResult::exhausted()
    {
        return PyResult();
    }

    bool PyResult::isSuccess() const { return this->state == RESULT_SUCCESS; }
    bool PyResult::isFailure() const { return this->state == RESULT_FAILURE; }
    bool PyResult::isExhausted() const { return this->state == RESULT_EXHAUSTED; }

    const PyObjectRef& PyResult::getValue() const
    {
        if (this->state != RESULT_SUCCESS) throw std::logic_error("Result holds no value.");
        return this->value;
    }

    const PyError& PyResult::getError() const
    {
        if (this->state != RESULT_FAILURE) throw std::logic_error("Result holds no error.");
        return this->error;
    }

    //=========================================================================
    // PyCodeBlob
    //=========================================================================

    PyCodeBlob::PyCodeBlob(std::vector<unsigned char> bytes) : bytes(std::move(bytes))
    {
    }

    const std::vector<unsigned char>& PyCodeBlob::getBytes() const
    {
        return this->bytes;
    }

    unsigned long PyCodeBlob::getSize() const
    {
        return this->bytes.size();
    }
}
