#include <gtest/gtest.h>
#include "../headers/pyCore.h"

using namespace pycore;

class ContextTest : public ::testing::Test {
protected:
    pycore::PyContext* context;

    void SetUp() override {
        context = new pycore::PyContext();
    }

    void TearDown() override {
        delete context;
    }
};

TEST_F(ContextTest, RootTypeHasNoTypeLink) {
    PyReadGuard type = context->typeType.borrow();
    ASSERT_TRUE(type->isClass());
    ASSERT_EQ(type->getName(), "type");
    ASSERT_TRUE(type->getType().isNull());
}

TEST_F(ContextTest, CanonicalTypesAreClassesOfType) {
    const PyObjectRef* types[] = {
        &context->integerType, &context->stringType, &context->booleanType,
        &context->listType, &context->tupleType, &context->dictType,
        &context->iteratorType, &context->sliceType, &context->nameErrorType,
        &context->codeType, &context->functionType, &context->moduleType,
        &context->noneType, &context->nativeFunctionType
    };
    for (const PyObjectRef* type : types) {
        PyReadGuard guard = type->borrow();
        ASSERT_TRUE(guard->isClass());
        ASSERT_TRUE(guard->getType().isSameObject(context->typeType));
    }
    ASSERT_EQ(context->integerType.str(), "<class 'int'>");
    ASSERT_EQ(context->noneType.str(), "<class 'NoneType'>");
}

TEST_F(ContextTest, FactoriesLinkTheCanonicalType) {
    ASSERT_TRUE(context->newInteger(1).borrow()->getType().isSameObject(context->integerType));
    ASSERT_TRUE(context->newString("s").borrow()->getType().isSameObject(context->stringType));
    ASSERT_TRUE(context->newBoolean(true).borrow()->getType().isSameObject(context->booleanType));
    ASSERT_TRUE(context->newList().borrow()->getType().isSameObject(context->listType));
    ASSERT_TRUE(context->newTuple().borrow()->getType().isSameObject(context->tupleType));
    ASSERT_TRUE(context->newDict().borrow()->getType().isSameObject(context->dictType));
    ASSERT_TRUE(context->newSlice().borrow()->getType().isSameObject(context->sliceType));
    ASSERT_TRUE(context->newNameError("x").borrow()->getType().isSameObject(context->nameErrorType));
    ASSERT_TRUE(context->newModule("m").borrow()->getType().isSameObject(context->moduleType));
    ASSERT_TRUE(context->newClass("Point").borrow()->getType().isSameObject(context->typeType));
    ASSERT_TRUE(context->getNone().borrow()->getType().isSameObject(context->noneType));
}

TEST_F(ContextTest, FactoriesNeverDeduplicate) {
    ASSERT_FALSE(context->newInteger(5).isSameObject(context->newInteger(5)));
    ASSERT_FALSE(context->newString("a").isSameObject(context->newString("a")));
    ASSERT_FALSE(context->newBoolean(true).isSameObject(context->newBoolean(true)));
    ASSERT_TRUE(context->getNone().isSameObject(context->getNone()));
}

TEST_F(ContextTest, KindsAreFixedAtCreation) {
    PyReadGuard value = context->newInteger(12).borrow();
    ASSERT_EQ(value->getKindTag(), KIND_INTEGER);
    ASSERT_TRUE(value->isInteger());
    ASSERT_FALSE(value->isString());
    ASSERT_EQ(value->asInteger(), 12);
    ASSERT_THROW(value->asString(), std::runtime_error);
    ASSERT_THROW(value->asList(), std::runtime_error);
}

TEST_F(ContextTest, ContainersRejectNullElements) {
    ASSERT_THROW(context->newList({PyObjectRef()}), std::invalid_argument);
    ASSERT_THROW(context->newTuple({context->newInteger(1), PyObjectRef()}), std::invalid_argument);
    PyObjectDict entries;
    entries["k"] = PyObjectRef();
    ASSERT_THROW(context->newDict(entries), std::invalid_argument);
    ASSERT_THROW(context->newIterator(PyObjectRef()), std::invalid_argument);
    ASSERT_THROW(context->newCode(nullptr), std::invalid_argument);
    ASSERT_THROW(context->newNativeFunction(nullptr), std::invalid_argument);
}

TEST_F(ContextTest, SliceBoundsMayBeAbsent) {
    int start = 1;
    int step = -2;
    PyReadGuard slice = context->newSlice(&start, nullptr, &step).borrow();
    ASSERT_TRUE(slice->isSlice());
    ASSERT_EQ(slice->str(), "<slice '1:None:-2'>");
}

TEST_F(ContextTest, CodeObjectsShareTheirBlob) {
    auto blob = std::make_shared<const PyCodeBlob>(std::vector<unsigned char>{1, 2, 3});
    PyObjectRef code = context->newCode(blob);
    PyObjectRef function = context->newFunction(blob);

    ASSERT_EQ(code.borrow()->asCodeBlob().get(), blob.get());
    ASSERT_EQ(function.borrow()->asCodeBlob().get(), blob.get());
    ASSERT_EQ(blob->getSize(), 3u);
    ASSERT_TRUE(function.borrow()->isCallable());
    ASSERT_FALSE(code.borrow()->isCallable());
}

TEST_F(ContextTest, GetIteratorRejectsNonSequences) {
    PyResult result = context->getIterator(context->newInteger(3));
    ASSERT_TRUE(result.isFailure());
    ASSERT_EQ(result.getError().getKind(), ERROR_UNSUPPORTED_ITERATION);
    ASSERT_EQ(result.getError().getMessage(), "'int' object is not iterable");

    ASSERT_TRUE(context->getIterator(context->newList()).isSuccess());
    ASSERT_TRUE(context->getIterator(context->newTuple()).isSuccess());
}

namespace {
    int failuresSeen = 0;
    int lastFailureKind = 0;

    void countFailure(PyContext* context, const PyError& error) {
        ++failuresSeen;
        lastFailureKind = error.getKind();
    }
}

TEST_F(ContextTest, FailureCallbackObservesEveryFailure) {
    failuresSeen = 0;
    context->failureCallback = countFailure;

    context->newInteger(1).divide(context, context->newInteger(0));
    ASSERT_EQ(failuresSeen, 1);
    ASSERT_EQ(lastFailureKind, ERROR_DIVISION_BY_ZERO);

    context->newInteger(1).add(context, context->newInteger(2));
    ASSERT_EQ(failuresSeen, 1);
}

TEST_F(ContextTest, FailCarriesItsPayload) {
    PyObjectRef payload = context->newString("boom");
    PyResult result = context->fail(ERROR_EXCEPTION, "raised", payload);

    ASSERT_TRUE(result.isFailure());
    ASSERT_TRUE(result.getError().getPayload().isSameObject(payload));
    ASSERT_EQ(result.getError().toString(), "Exception: raised");
    ASSERT_THROW(result.getValue(), std::logic_error);
}

TEST_F(ContextTest, ResultStates) {
    PyResult exhausted = PyResult::exhausted();
    ASSERT_TRUE(exhausted.isExhausted());
    ASSERT_FALSE(exhausted.isSuccess());
    ASSERT_THROW(exhausted.getError(), std::logic_error);

    ASSERT_THROW(PyResult::success(PyObjectRef()), std::invalid_argument);
    PyResult success = PyResult::success(context->getNone());
    ASSERT_TRUE(success.isSuccess());
    ASSERT_TRUE(success.getValue().isSameObject(context->getNone()));
}
