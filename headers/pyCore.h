/*
 * pyCore
 *
 *  Created on: October, 2026
 *
 *  Public API of the pyCore runtime value engine: references, objects,
 *  the per-interpreter context, the result channel and the executor
 *  capability used by native callables.
 */

#ifndef PYCORE_H_
#define PYCORE_H_

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pycore
{
    // Forward declarations
    class Kind;
    class PyObject;
    class PyObjectRef;
    class PyReadGuard;
    class PyWriteGuard;
    class PyError;
    class PyResult;
    class PyCodeBlob;
    class PyExecutor;
    class PyContext;

    //! Kind tags. Every PyObject carries exactly one of them for its whole life.
    #define KIND_STRING 0
    #define KIND_INTEGER 1
    #define KIND_BOOLEAN 2
    #define KIND_LIST 3
    #define KIND_TUPLE 4
    #define KIND_DICT 5
    #define KIND_ITERATOR 6
    #define KIND_SLICE 7
    #define KIND_NAME_ERROR 8
    #define KIND_CODE 9
    #define KIND_FUNCTION 10
    #define KIND_MODULE 11
    #define KIND_NONE 12
    #define KIND_CLASS 13
    #define KIND_NATIVE_FUNCTION 14
    #define KIND_COUNT 15

    //! Failure kinds carried by PyError.
    #define ERROR_TYPE 1
    #define ERROR_VALUE 2
    #define ERROR_OVERFLOW 3
    #define ERROR_DIVISION_BY_ZERO 4
    #define ERROR_NOT_CALLABLE 5
    #define ERROR_UNSUPPORTED_ITERATION 6
    #define ERROR_ATTRIBUTE 7
    #define ERROR_INDEX 8
    #define ERROR_KEY 9
    #define ERROR_EXCEPTION 10

    //! Binary operators served by the flat dispatch table.
    #define OPERATOR_ADD 0
    #define OPERATOR_SUBTRACT 1
    #define OPERATOR_MULTIPLY 2
    #define OPERATOR_DIVIDE 3
    #define OPERATOR_COUNT 4

    //! Diagnostic levels for PyContext::traceLevel.
    #define TRACE_SILENT 0
    #define TRACE_FAILURES 1
    #define TRACE_DISPATCH 2

    typedef std::vector<PyObjectRef> PyObjectList;
    typedef std::map<std::string, PyObjectRef> PyObjectDict;

    //! Fixed signature of every native callable.
    typedef PyResult (*PyNativeFunction)(PyExecutor* executor, const PyObjectList& args);

    //! Hook consulted when the flat operator table has no entry. Returns true when it produced \a result.
    typedef bool (*PyBinaryOperatorFallback)(
        PyContext* context,
        int op,
        const PyObjectRef& left,
        const PyObjectRef& right,
        PyResult& result
    );

    /**
     * @brief Thrown when a borrow request conflicts with a live borrow of the same object.
     * This is a host bug, never a user-triggered condition.
     */
    class BorrowError : public std::logic_error
    {
    public:
        explicit BorrowError(const std::string& what) : std::logic_error(what) {}
    };

    /**
     * @class PyObjectRef
     * @brief Shared, reference-counted handle to a PyObject.
     *
     * Copies alias the same object. Access goes through borrow() (shared, read-only)
     * or borrowMut() (exclusive). The object is reclaimed with its last reference;
     * reference cycles are never reclaimed.
     */
    class PyObjectRef
    {
    public:
        PyObjectRef();
        explicit PyObjectRef(std::shared_ptr<PyObject> object);

        bool isNull() const;
        explicit operator bool() const;
        bool isSameObject(const PyObjectRef& other) const;
        long getUseCount() const;

        //- Borrowing
        PyReadGuard borrow() const;
        PyWriteGuard borrowMut() const;

        //- Rendering
        std::string str() const;

        //- Arithmetic Operations
        PyResult add(PyContext* context, const PyObjectRef& other) const;
        PyResult subtract(PyContext* context, const PyObjectRef& other) const;
        PyResult multiply(PyContext* context, const PyObjectRef& other) const;
        PyResult divide(PyContext* context, const PyObjectRef& other) const;

        //- Comparison
        PyResult equals(PyContext* context, const PyObjectRef& other) const;
        PyResult notEquals(PyContext* context, const PyObjectRef& other) const;
        PyResult lessThan(PyContext* context, const PyObjectRef& other) const;
        PyResult lessOrEqual(PyContext* context, const PyObjectRef& other) const;
        PyResult greaterThan(PyContext* context, const PyObjectRef& other) const;
        PyResult greaterOrEqual(PyContext* context, const PyObjectRef& other) const;
        PyResult compare(PyContext* context, const PyObjectRef& other) const;

        //- Iteration
        PyResult advance(PyContext* context) const;

        //- Execution
        PyResult invoke(PyExecutor* executor, const PyObjectList& args) const;

        //- Attributes
        PyResult getAttribute(PyContext* context, const std::string& name) const;
        void setAttribute(const std::string& name, const PyObjectRef& value) const;
        bool hasAttribute(const std::string& name) const;
        PyResult deleteAttribute(PyContext* context, const std::string& name) const;

        //- Containers
        PyResult getItem(PyContext* context, const PyObjectRef& key) const;
        PyResult setItem(PyContext* context, const PyObjectRef& key, const PyObjectRef& value) const;
        PyResult length(PyContext* context) const;
        PyResult append(PyContext* context, const PyObjectRef& value) const;
        PyResult contains(PyContext* context, const PyObjectRef& value) const;

        //- Truthiness
        bool isTrue() const;

    private:
        std::shared_ptr<PyObject> object;
    };

    /**
     * @class PyReadGuard
     * @brief A live shared borrow. Any number may coexist; none may coexist with a PyWriteGuard.
     */
    class PyReadGuard
    {
    public:
        explicit PyReadGuard(std::shared_ptr<PyObject> object);
        PyReadGuard(PyReadGuard&& other) noexcept;
        PyReadGuard(const PyReadGuard&) = delete;
        PyReadGuard& operator=(const PyReadGuard&) = delete;
        ~PyReadGuard();

        const PyObject* operator->() const { return object.get(); }
        const PyObject& operator*() const { return *object; }

    private:
        std::shared_ptr<PyObject> object;
    };

    /**
     * @class PyWriteGuard
     * @brief A live exclusive borrow.
     */
    class PyWriteGuard
    {
    public:
        explicit PyWriteGuard(std::shared_ptr<PyObject> object);
        PyWriteGuard(PyWriteGuard&& other) noexcept;
        PyWriteGuard(const PyWriteGuard&) = delete;
        PyWriteGuard& operator=(const PyWriteGuard&) = delete;
        ~PyWriteGuard();

        PyObject* operator->() const { return object.get(); }
        PyObject& operator*() const { return *object; }

    private:
        std::shared_ptr<PyObject> object;
    };

    /**
     * @class PyObject
     * @brief A runtime value: one Kind, an optional type link and an open attribute table.
     *
     * Objects are only built through PyObject::create or the PyContext factories.
     */
    class PyObject
    {
    public:
        /**
         * @brief The single construction entry point.
         * @param kind The payload; ownership is taken.
         * @param type The type object. Null only for the root `type` object.
         */
        static PyObjectRef create(std::unique_ptr<Kind> kind, const PyObjectRef& type);

        ~PyObject();
        PyObject(const PyObject&) = delete;
        PyObject& operator=(const PyObject&) = delete;

        //- Kind
        int getKindTag() const;
        const Kind& getKind() const;
        Kind& getKind();
        const char* getTypeName() const;
        const PyObjectRef& getType() const;

        //- Type Checking
        bool isString() const;
        bool isInteger() const;
        bool isBoolean() const;
        bool isList() const;
        bool isTuple() const;
        bool isDict() const;
        bool isIterator() const;
        bool isSlice() const;
        bool isNameError() const;
        bool isCode() const;
        bool isFunction() const;
        bool isModule() const;
        bool isNone() const;
        bool isClass() const;
        bool isNativeFunction() const;
        bool isCallable() const;

        //- Type Coercion (throw std::runtime_error on a kind mismatch)
        const std::string& asString() const;
        int asInteger() const;
        bool asBoolean() const;
        const PyObjectList& asList() const;
        PyObjectList& asList();
        const PyObjectList& asTuple() const;
        const PyObjectDict& asDict() const;
        PyObjectDict& asDict();
        const std::string& getName() const;
        PyNativeFunction asNativeFunction() const;
        const std::shared_ptr<const PyCodeBlob>& asCodeBlob() const;
        unsigned long getIteratorPosition() const;
        const PyObjectRef& getIteratorTarget() const;

        //- Own attribute table
        bool hasOwnAttribute(const std::string& name) const;
        PyObjectRef getOwnAttribute(const std::string& name) const;
        void setOwnAttribute(const std::string& name, const PyObjectRef& value);
        bool removeOwnAttribute(const std::string& name);
        const PyObjectDict& getOwnAttributes() const;

        //- Rendering
        std::string str() const;
        void renderTo(std::string& out, std::vector<const PyObject*>& visiting) const;

    private:
        friend class PyReadGuard;
        friend class PyWriteGuard;

        PyObject(std::unique_ptr<Kind> kind, const PyObjectRef& type);

        std::unique_ptr<Kind> kind;
        PyObjectRef type;
        PyObjectDict attributes;

        // 0: free, > 0: number of readers, -1: one writer
        long borrowState;
    };

    /**
     * @class PyError
     * @brief A recoverable failure: a kind code, a message and an optional language-level value.
     */
    class PyError
    {
    public:
        PyError();
        PyError(int kind, std::string message, PyObjectRef payload = PyObjectRef());

        int getKind() const;
        const char* getKindName() const;
        const std::string& getMessage() const;
        const PyObjectRef& getPayload() const;

        /** Default host-facing rendering, "TypeError: message". */
        std::string toString() const;

    private:
        int kind;
        std::string message;
        PyObjectRef payload;
    };

    #define RESULT_SUCCESS 0
    #define RESULT_FAILURE 1
    #define RESULT_EXHAUSTED 2

    /**
     * @class PyResult
     * @brief The two-outcome channel every fallible operation returns through.
     *
     * A result holds either a value or a PyError. Iteration adds a third state,
     * exhaustion, which carries neither.
     */
    class PyResult
    {
    public:
        PyResult();

        static PyResult success(const PyObjectRef& value);
        static PyResult failure(const PyError& error);
        static PyResult exhausted();

        bool isSuccess() const;
        bool isFailure() const;
        bool isExhausted() const;

        /** Throws std::logic_error unless isSuccess(). */
        const PyObjectRef& getValue() const;
        /** Throws std::logic_error unless isFailure(). */
        const PyError& getError() const;

    private:
        int state;
        PyObjectRef value;
        PyError error;
    };

    /**
     * @class PyCodeBlob
     * @brief An opaque compiled program. pyCore stores it and never looks inside.
     */
    class PyCodeBlob
    {
    public:
        explicit PyCodeBlob(std::vector<unsigned char> bytes);

        const std::vector<unsigned char>& getBytes() const;
        unsigned long getSize() const;

    private:
        std::vector<unsigned char> bytes;
    };

    /**
     * @class PyExecutor
     * @brief The narrow capability the evaluator hands to native callables.
     *
     * Native functions depend on this surface only, never on frames or stacks.
     */
    class PyExecutor
    {
    public:
        virtual ~PyExecutor() = default;

        /** Invokes \a callable with \a args; interpreted functions are run by the evaluator. */
        virtual PyResult call(const PyObjectRef& callable, const PyObjectList& args) = 0;
        virtual PyObjectRef newString(const std::string& value) = 0;
        virtual PyObjectRef newBoolean(bool value) = 0;
        virtual PyObjectRef getNone() = 0;
        virtual PyObjectRef getType() = 0;
        virtual PyContext* getContext() = 0;
    };

    /**
     * @brief Per-interpreter holder of canonical type objects, value factories and configuration.
     *
     * Created once per interpreter instance and passed explicitly to every operation
     * that builds values. There is no global instance.
     */
    class PyContext
    {
    public:
        explicit PyContext();
        ~PyContext();
        PyContext(const PyContext&) = delete;
        PyContext& operator=(const PyContext&) = delete;

        //- Canonical type objects
        PyObjectRef typeType;
        PyObjectRef integerType;
        PyObjectRef stringType;
        PyObjectRef booleanType;
        PyObjectRef listType;
        PyObjectRef tupleType;
        PyObjectRef dictType;
        PyObjectRef iteratorType;
        PyObjectRef sliceType;
        PyObjectRef nameErrorType;
        PyObjectRef codeType;
        PyObjectRef functionType;
        PyObjectRef moduleType;
        PyObjectRef noneType;
        PyObjectRef nativeFunctionType;

        //- Configuration
        unsigned long maxStringLength;
        int traceLevel;

        //- Callbacks
        PyBinaryOperatorFallback binaryOperatorFallback;
        //! Sees every failure built by fail(). Operands may still be read-borrowed while it runs.
        void (*failureCallback)(PyContext* context, const PyError& error);

        //- Factory methods for primitive types. Every call builds a fresh object.
        PyObjectRef newInteger(int value);
        PyObjectRef newString(const std::string& value);
        PyObjectRef newBoolean(bool value);
        PyObjectRef newNameError(const std::string& name);
        /** Absent bounds are passed as nullptr. */
        PyObjectRef newSlice(const int* start = nullptr, const int* stop = nullptr, const int* step = nullptr);

        //- Factory methods for containers
        PyObjectRef newList(const PyObjectList& elements = PyObjectList());
        PyObjectRef newTuple(const PyObjectList& elements = PyObjectList());
        PyObjectRef newDict(const PyObjectDict& elements = PyObjectDict());
        PyObjectRef newIterator(const PyObjectRef& target);
        /** Builds an iterator over a List or Tuple; other kinds fail with ERROR_UNSUPPORTED_ITERATION. */
        PyResult getIterator(const PyObjectRef& target);

        //- Factory methods for code, callables and namespaces
        PyObjectRef newCode(const std::shared_ptr<const PyCodeBlob>& blob);
        PyObjectRef newFunction(const std::shared_ptr<const PyCodeBlob>& blob);
        PyObjectRef newNativeFunction(PyNativeFunction function);
        PyObjectRef newModule(const std::string& name);
        PyObjectRef newClass(const std::string& name);

        /** The canonical None object. */
        const PyObjectRef& getNone() const;

        //- Diagnostics
        /** Builds a failure result, reporting it to the trace and to failureCallback. */
        PyResult fail(int kind, const std::string& message, const PyObjectRef& payload = PyObjectRef());
        void trace(int level, const std::string& message) const;

    private:
        PyObjectRef noneObject;
    };
}

#endif /* PYCORE_H_ */
