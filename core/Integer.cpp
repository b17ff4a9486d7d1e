/*
 * Integer.cpp
 *
 *  Created on: October 2026
 *
 *  Checked arithmetic on 32-bit integers. Every operation is computed in
 *  64 bits and range-checked, so overflow is reported instead of wrapping.
 */

#include "../headers/pycore_internal.h"
#include <string>

namespace pycore
{
    namespace
    {
        bool narrow(long long wide, int& result)
        {
            if (wide < INT_MIN || wide > INT_MAX) return false;
            result = static_cast<int>(wide);
            return true;
        }
    }

    bool Integer::add(int left, int right, int& result)
    {
        return narrow(static_cast<long long>(left) + right, result);
    }

    bool Integer::subtract(int left, int right, int& result)
    {
        return narrow(static_cast<long long>(left) - right, result);
    }

    bool Integer::multiply(int left, int right, int& result)
    {
        return narrow(static_cast<long long>(left) * right, result);
    }

    bool Integer::divide(int left, int right, int& result)
    {
        if (right == 0) throw std::invalid_argument("Integer::divide called with a zero divisor.");
        // INT_MIN / -1 is the only quotient that leaves the range
        return narrow(static_cast<long long>(left) / right, result);
    }

    int Integer::compare(int left, int right)
    {
        if (left < right) return -1;
        return left > right ? 1 : 0;
    }

    std::string Integer::toString(int value)
    {
        return std::to_string(value);
    }
}
