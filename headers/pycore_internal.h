/*
 * pycore_internal.h
 *
 *  Created on: October 2026
 *
 *  Kind payloads and the internal entry points shared by the core/ sources.
 */

#ifndef PYCORE_INTERNAL_H
#define PYCORE_INTERNAL_H

#include "pyCore.h"
#include <climits>
#include <memory>
#include <string>
#include <vector>

namespace pycore
{
    /**
     * @class Kind
     * @brief Base of every value payload.
     *
     * render() is pure virtual: a payload class without a rendering cannot be
     * instantiated, so every kind is guaranteed to print.
     */
    class Kind
    {
    public:
        virtual ~Kind() = default;
        virtual int getTag() const = 0;
        virtual void render(std::string& out, std::vector<const PyObject*>& visiting) const = 0;
    };

    class StringKind final : public Kind
    {
    public:
        std::string value;

        explicit StringKind(std::string v) : value(std::move(v)) {}
        int getTag() const override { return KIND_STRING; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class IntegerKind final : public Kind
    {
    public:
        const int value;

        explicit IntegerKind(int v) : value(v) {}
        int getTag() const override { return KIND_INTEGER; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class BooleanKind final : public Kind
    {
    public:
        const bool value;

        explicit BooleanKind(bool v) : value(v) {}
        int getTag() const override { return KIND_BOOLEAN; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class ListKind final : public Kind
    {
    public:
        PyObjectList elements;

        explicit ListKind(PyObjectList e) : elements(std::move(e)) {}
        int getTag() const override { return KIND_LIST; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class TupleKind final : public Kind
    {
    public:
        const PyObjectList elements;

        explicit TupleKind(PyObjectList e) : elements(std::move(e)) {}
        int getTag() const override { return KIND_TUPLE; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class DictKind final : public Kind
    {
    public:
        PyObjectDict elements;

        explicit DictKind(PyObjectDict e) : elements(std::move(e)) {}
        int getTag() const override { return KIND_DICT; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class IteratorKind final : public Kind
    {
    public:
        unsigned long position;
        bool exhausted;
        const PyObjectRef target;

        explicit IteratorKind(PyObjectRef t) : position(0), exhausted(false), target(std::move(t)) {}
        int getTag() const override { return KIND_ITERATOR; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    //! One optional slice bound.
    struct SliceBound
    {
        bool present;
        int value;
    };

    class SliceKind final : public Kind
    {
    public:
        const SliceBound start;
        const SliceBound stop;
        const SliceBound step;

        SliceKind(SliceBound start, SliceBound stop, SliceBound step) : start(start), stop(stop), step(step) {}
        int getTag() const override { return KIND_SLICE; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class NameErrorKind final : public Kind
    {
    public:
        const std::string name;

        explicit NameErrorKind(std::string n) : name(std::move(n)) {}
        int getTag() const override { return KIND_NAME_ERROR; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class CodeKind final : public Kind
    {
    public:
        const std::shared_ptr<const PyCodeBlob> blob;

        explicit CodeKind(std::shared_ptr<const PyCodeBlob> b) : blob(std::move(b)) {}
        int getTag() const override { return KIND_CODE; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    //! A function over a compiled blob; closures are not captured yet.
    class FunctionKind final : public Kind
    {
    public:
        const std::shared_ptr<const PyCodeBlob> blob;

        explicit FunctionKind(std::shared_ptr<const PyCodeBlob> b) : blob(std::move(b)) {}
        int getTag() const override { return KIND_FUNCTION; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class ModuleKind final : public Kind
    {
    public:
        const std::string name;

        explicit ModuleKind(std::string n) : name(std::move(n)) {}
        int getTag() const override { return KIND_MODULE; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class NoneKind final : public Kind
    {
    public:
        int getTag() const override { return KIND_NONE; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    //! A class object. There is no member table beyond the generic attribute table.
    class ClassKind final : public Kind
    {
    public:
        const std::string name;

        explicit ClassKind(std::string n) : name(std::move(n)) {}
        int getTag() const override { return KIND_CLASS; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    class NativeFunctionKind final : public Kind
    {
    public:
        const PyNativeFunction function;

        explicit NativeFunctionKind(PyNativeFunction f) : function(f) {}
        int getTag() const override { return KIND_NATIVE_FUNCTION; }
        void render(std::string& out, std::vector<const PyObject*>& visiting) const override;
    };

    template <typename K> inline const K& kindOf(const PyObject& object) { return static_cast<const K&>(object.getKind()); }
    template <typename K> inline K& kindOf(PyObject& object) { return static_cast<K&>(object.getKind()); }

    //! Python-facing type name of a kind tag ("int", "str", ...).
    const char* kindName(int tag);
    const char* operatorSymbol(int op);

    //- Flat operator table (Operators.cpp)
    PyResult dispatchBinaryOperator(PyContext* context, int op, const PyObjectRef& left, const PyObjectRef& right);

    //- Equality & ordering (Comparison.cpp)
    bool isEquatable(int tag);
    bool isOrderable(int tag);
    /** 1 when equal, 0 when not, -1 on failure (then \a failure holds it). */
    int testEquality(PyContext* context, const PyObject& left, const PyObject& right, PyResult& failure);
    /** 1 when ordered, -1 on failure; \a order receives -1, 0 or 1. */
    int testOrder(PyContext* context, const PyObject& left, const PyObject& right, int& order, PyResult& failure);

    /**
     * @class Integer
     * @brief Checked 32-bit arithmetic. Each operation returns false on overflow.
     */
    class Integer
    {
    public:
        static bool add(int left, int right, int& result);
        static bool subtract(int left, int right, int& result);
        static bool multiply(int left, int right, int& result);
        /** Truncating division. The caller rejects a zero divisor. */
        static bool divide(int left, int right, int& result);
        static int compare(int left, int right);
        static std::string toString(int value);
    };
}

#endif //PYCORE_INTERNAL_H
