/*
 * dispatch_benchmark.cpp
 *
 *  Created on: October 2026
 *
 *  Times binary operator dispatch, iteration and equality over lists.
 */

#include <iostream>
#include <chrono>
#include "../headers/pyCore.h"

using namespace pycore;

namespace
{
    void integerAddition(PyContext* context, int iterations)
    {
        std::cout << "--- Integer Addition Benchmark ---" << std::endl;
        std::cout << "Iterations: " << iterations << std::endl;

        auto start = std::chrono::high_resolution_clock::now();
        PyObjectRef one = context->newInteger(1);
        PyObjectRef total = context->newInteger(0);
        for (int i = 0; i < iterations; ++i) {
            PyResult sum = total.add(context, one);
            if (!sum.isSuccess()) {
                std::cerr << "Addition failed: " << sum.getError().toString() << std::endl;
                return;
            }
            total = sum.getValue();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> diff = end - start;
        std::cout << "Dispatch time: " << diff.count() << " s" << std::endl;

        const int result = total.borrow()->asInteger();
        if (result != iterations) {
            std::cerr << "Checksum mismatch! Got " << result << ", expected " << iterations << std::endl;
        } else {
            std::cout << "Checksum verified." << std::endl;
        }
    }

    void listIteration(PyContext* context, int iterations)
    {
        std::cout << "--- List Iteration Benchmark ---" << std::endl;
        std::cout << "Elements: " << iterations << std::endl;

        PyObjectRef list = context->newList();
        for (int i = 0; i < iterations; ++i) {
            PyResult appended = list.append(context, context->newInteger(i));
            if (!appended.isSuccess()) {
                std::cerr << "Append failed: " << appended.getError().toString() << std::endl;
                return;
            }
        }

        auto start = std::chrono::high_resolution_clock::now();
        long long checksum = 0;
        PyObjectRef iterator = context->getIterator(list).getValue();
        for (PyResult step = iterator.advance(context); step.isSuccess(); step = iterator.advance(context)) {
            checksum += step.getValue().borrow()->asInteger();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> diff = end - start;
        std::cout << "Iteration time: " << diff.count() << " s" << std::endl;

        const long long expected = (long long)(iterations - 1) * iterations / 2;
        if (checksum != expected) {
            std::cerr << "Checksum mismatch! Got " << checksum << ", expected " << expected << std::endl;
        } else {
            std::cout << "Checksum verified." << std::endl;
        }

        start = std::chrono::high_resolution_clock::now();
        PyObjectRef copy = context->newList(list.borrow()->asList());
        PyResult equal = list.equals(context, copy);
        end = std::chrono::high_resolution_clock::now();
        diff = end - start;
        std::cout << "Copy and compare time: " << diff.count() << " s" << std::endl;
        if (!equal.isSuccess() || !equal.getValue().isTrue()) {
            std::cerr << "Copied list does not compare equal." << std::endl;
        }
    }
}

int main(int argc, char* argv[])
{
    PyContext context;
    const int iterations = 1000000;

    integerAddition(&context, iterations);
    listIteration(&context, iterations);

    std::cout << "--------------------------" << std::endl;
    return 0;
}
