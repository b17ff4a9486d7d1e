#include <gtest/gtest.h>
#include "../headers/pyCore.h"

using namespace pycore;

class ContainerTest : public ::testing::Test {
protected:
    pycore::PyContext* context;
    PyObjectRef digits;

    void SetUp() override {
        context = new pycore::PyContext();
        PyObjectList elements;
        for (int i = 0; i < 10; ++i) {
            elements.push_back(context->newInteger(i));
        }
        digits = context->newList(elements);
    }

    void TearDown() override {
        digits = PyObjectRef();
        delete context;
    }

    PyObjectRef slice(const int* start, const int* stop, const int* step = nullptr) {
        return context->newSlice(start, stop, step);
    }

    bool truth(const PyResult& result) {
        return result.getValue().borrow()->asBoolean();
    }
};

TEST_F(ContainerTest, IndexingSequences) {
    ASSERT_EQ(digits.getItem(context, context->newInteger(3)).getValue().str(), "3");
    ASSERT_EQ(digits.getItem(context, context->newInteger(-1)).getValue().str(), "9");
    ASSERT_EQ(digits.getItem(context, context->newInteger(-10)).getValue().str(), "0");

    PyObjectRef tuple = context->newTuple({context->newString("a"), context->newString("b")});
    ASSERT_EQ(tuple.getItem(context, context->newInteger(1)).getValue().str(), "b");
}

TEST_F(ContainerTest, IndexOutOfRange) {
    PyResult high = digits.getItem(context, context->newInteger(10));
    ASSERT_EQ(high.getError().getKind(), ERROR_INDEX);
    ASSERT_EQ(high.getError().getMessage(), "list index out of range");
    ASSERT_EQ(digits.getItem(context, context->newInteger(-11)).getError().getKind(), ERROR_INDEX);
    ASSERT_EQ(context->newTuple().getItem(context, context->newInteger(0)).getError().getKind(), ERROR_INDEX);
}

TEST_F(ContainerTest, SlicingLists) {
    int two = 2;
    int five = 5;
    int minusTwo = -2;
    int minusOne = -1;
    int three = 3;

    ASSERT_EQ(digits.getItem(context, slice(&two, &five)).getValue().str(), "[2, 3, 4]");
    ASSERT_EQ(digits.getItem(context, slice(&minusTwo, nullptr)).getValue().str(), "[8, 9]");
    ASSERT_EQ(digits.getItem(context, slice(nullptr, nullptr, &minusOne)).getValue().str(), "[9, 8, 7, 6, 5, 4, 3, 2, 1, 0]");
    ASSERT_EQ(digits.getItem(context, slice(nullptr, nullptr, &three)).getValue().str(), "[0, 3, 6, 9]");
    ASSERT_EQ(digits.getItem(context, slice(&five, &two)).getValue().str(), "[]");
    ASSERT_EQ(digits.getItem(context, slice(&five, &two, &minusOne)).getValue().str(), "[5, 4, 3]");
}

TEST_F(ContainerTest, SliceBoundsAreClamped) {
    int low = -100;
    int high = 100;
    ASSERT_EQ(digits.getItem(context, slice(&low, &high)).getValue().str(), "[0, 1, 2, 3, 4, 5, 6, 7, 8, 9]");
    ASSERT_EQ(digits.getItem(context, slice(&high, nullptr)).getValue().str(), "[]");
}

TEST_F(ContainerTest, SlicesAreFreshContainers) {
    PyObjectRef copy = digits.getItem(context, slice(nullptr, nullptr)).getValue();
    ASSERT_FALSE(copy.isSameObject(digits));
    ASSERT_TRUE(copy.append(context, context->newInteger(10)).isSuccess());
    ASSERT_EQ(digits.length(context).getValue().borrow()->asInteger(), 10);

    PyObjectRef tuple = context->newTuple({context->newInteger(1), context->newInteger(2)});
    PyReadGuard tail = tuple.getItem(context, slice(nullptr, nullptr)).getValue().borrow();
    ASSERT_TRUE(tail->isTuple());
}

TEST_F(ContainerTest, ZeroStepIsAValueError) {
    int zero = 0;
    PyResult result = digits.getItem(context, slice(nullptr, nullptr, &zero));
    ASSERT_EQ(result.getError().getKind(), ERROR_VALUE);
    ASSERT_EQ(context->newString("abc").getItem(context, slice(nullptr, nullptr, &zero)).getError().getKind(), ERROR_VALUE);
}

TEST_F(ContainerTest, IndexingStrings) {
    PyObjectRef text = context->newString("hello");
    int one = 1;
    int four = 4;
    int minusOne = -1;

    ASSERT_EQ(text.getItem(context, context->newInteger(0)).getValue().str(), "h");
    ASSERT_EQ(text.getItem(context, context->newInteger(-1)).getValue().str(), "o");
    ASSERT_EQ(text.getItem(context, slice(&one, &four)).getValue().str(), "ell");
    ASSERT_EQ(text.getItem(context, slice(nullptr, nullptr, &minusOne)).getValue().str(), "olleh");
    ASSERT_EQ(text.getItem(context, context->newInteger(5)).getError().getKind(), ERROR_INDEX);
}

TEST_F(ContainerTest, BadIndexKinds) {
    PyResult result = digits.getItem(context, context->newString("0"));
    ASSERT_EQ(result.getError().getKind(), ERROR_TYPE);
    ASSERT_EQ(result.getError().getMessage(), "'list' indices must be integers or slices, not 'str'");

    PyResult notSubscriptable = context->newInteger(1).getItem(context, context->newInteger(0));
    ASSERT_EQ(notSubscriptable.getError().getMessage(), "'int' object is not subscriptable");
}

TEST_F(ContainerTest, DictionaryLookup) {
    PyObjectRef value = context->newInteger(1);
    PyObjectDict entries;
    entries["one"] = value;
    PyObjectRef dict = context->newDict(entries);

    ASSERT_TRUE(dict.getItem(context, context->newString("one")).getValue().isSameObject(value));

    PyResult missing = dict.getItem(context, context->newString("two"));
    ASSERT_EQ(missing.getError().getKind(), ERROR_KEY);
    ASSERT_EQ(missing.getError().getMessage(), "'two'");

    ASSERT_EQ(dict.getItem(context, context->newInteger(1)).getError().getKind(), ERROR_TYPE);
}

TEST_F(ContainerTest, SetItemOnLists) {
    PyObjectRef replacement = context->newString("x");
    ASSERT_TRUE(digits.setItem(context, context->newInteger(-1), replacement).isSuccess());
    ASSERT_TRUE(digits.getItem(context, context->newInteger(9)).getValue().isSameObject(replacement));

    ASSERT_EQ(digits.setItem(context, context->newInteger(10), replacement).getError().getKind(), ERROR_INDEX);
    ASSERT_EQ(digits.setItem(context, context->newString("a"), replacement).getError().getKind(), ERROR_TYPE);
}

TEST_F(ContainerTest, SetItemOnDictionaries) {
    PyObjectRef dict = context->newDict();
    ASSERT_TRUE(dict.setItem(context, context->newString("b"), context->newInteger(2)).isSuccess());
    ASSERT_TRUE(dict.setItem(context, context->newString("a"), context->newInteger(1)).isSuccess());
    ASSERT_TRUE(dict.setItem(context, context->newString("a"), context->newInteger(3)).isSuccess());

    ASSERT_EQ(dict.str(), "{'a': 3, 'b': 2}");
    ASSERT_EQ(dict.setItem(context, context->newInteger(1), context->getNone()).getError().getKind(), ERROR_TYPE);
}

TEST_F(ContainerTest, ImmutableKindsRejectItemAssignment) {
    PyObjectRef tuple = context->newTuple({context->newInteger(1)});
    PyResult result = tuple.setItem(context, context->newInteger(0), context->newInteger(2));
    ASSERT_EQ(result.getError().getKind(), ERROR_TYPE);
    ASSERT_EQ(result.getError().getMessage(), "'tuple' object does not support item assignment");
    ASSERT_EQ(context->newString("s").setItem(context, context->newInteger(0), context->newString("t")).getError().getKind(), ERROR_TYPE);
}

TEST_F(ContainerTest, ListCanStoreItself) {
    ASSERT_TRUE(digits.setItem(context, context->newInteger(0), digits).isSuccess());
    ASSERT_EQ(digits.str(), "[[...], 1, 2, 3, 4, 5, 6, 7, 8, 9]");
    ASSERT_TRUE(digits.setItem(context, context->newInteger(0), context->newInteger(0)).isSuccess());
}

TEST_F(ContainerTest, Length) {
    ASSERT_EQ(digits.length(context).getValue().borrow()->asInteger(), 10);
    ASSERT_EQ(context->newString("abc").length(context).getValue().borrow()->asInteger(), 3);
    ASSERT_EQ(context->newTuple().length(context).getValue().borrow()->asInteger(), 0);
    ASSERT_EQ(context->newDict().length(context).getValue().borrow()->asInteger(), 0);

    PyResult none = context->getNone().length(context);
    ASSERT_EQ(none.getError().getKind(), ERROR_TYPE);
    ASSERT_EQ(none.getError().getMessage(), "object of type 'NoneType' has no len()");
}

TEST_F(ContainerTest, AppendIsListOnly) {
    PyObjectRef list = context->newList();
    PyResult appended = list.append(context, context->newInteger(1));
    ASSERT_TRUE(appended.getValue().isSameObject(context->getNone()));
    ASSERT_EQ(list.str(), "[1]");

    ASSERT_EQ(context->newTuple().append(context, context->newInteger(1)).getError().getKind(), ERROR_TYPE);
    ASSERT_THROW(list.append(context, PyObjectRef()), std::invalid_argument);
}

TEST_F(ContainerTest, MembershipInSequences) {
    ASSERT_TRUE(truth(digits.contains(context, context->newInteger(7))));
    ASSERT_FALSE(truth(digits.contains(context, context->newInteger(70))));

    PyObjectRef mixed = context->newList({context->newInteger(1), context->getNone(), context->newString("x")});
    ASSERT_TRUE(truth(mixed.contains(context, context->newString("x"))));
    ASSERT_FALSE(truth(mixed.contains(context, context->newString("y"))));

    PyObjectRef none = context->getNone();
    ASSERT_TRUE(truth(mixed.contains(context, none)));
}

TEST_F(ContainerTest, MembershipInDictionariesAndStrings) {
    PyObjectDict entries;
    entries["key"] = context->newInteger(1);
    PyObjectRef dict = context->newDict(entries);

    ASSERT_TRUE(truth(dict.contains(context, context->newString("key"))));
    ASSERT_FALSE(truth(dict.contains(context, context->newString("value"))));
    ASSERT_EQ(dict.contains(context, context->newInteger(1)).getError().getKind(), ERROR_TYPE);

    PyObjectRef text = context->newString("haystack");
    ASSERT_TRUE(truth(text.contains(context, context->newString("st"))));
    ASSERT_FALSE(truth(text.contains(context, context->newString("needle"))));
    ASSERT_EQ(text.contains(context, context->newInteger(1)).getError().getKind(), ERROR_TYPE);

    ASSERT_EQ(context->newInteger(5).contains(context, context->newInteger(5)).getError().getKind(), ERROR_TYPE);
}
