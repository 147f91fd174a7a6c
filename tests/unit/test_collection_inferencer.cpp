/**
 * @file test_collection_inferencer.cpp
 * @brief Unit tests for CollectionInferencer
 */

#include <framework/mapr_test.hpp>

#include <any>
#include <array>
#include <optional>
#include <vector>

using namespace mapr::test;

namespace {

std::vector<int64_t> drain(ErasedCursor& cursor) {
    std::vector<int64_t> ids;
    std::any element;
    while (cursor.next(element)) {
        if (const auto* ptr = std::any_cast<const User*>(&element)) {
            ids.push_back((*ptr)->id);
        } else if (const auto* user = std::any_cast<User>(&element)) {
            ids.push_back(user->id);
        }
    }
    return ids;
}

}  // namespace

TEST(CollectionInferencerTest, AbsentSequenceIsInvalidArgument) {
    auto result = CollectionInferencer::infer(ErasedSequence());
    ASSERT_RESULT_ERROR_CODE(result, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(result.message(), "Source collection must not be null");
}

TEST(CollectionInferencerTest, ReifiedParameterFirst) {
    std::vector<User> users = make_users(2);

    auto result = CollectionInferencer::infer(ErasedSequence::of(users));
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(*result.value().element_type, typeid(User));
    EXPECT_EQ(result.value().source, ElementTypeSource::REIFIED_PARAMETER);
    EXPECT_EQ(source_name(result.value().source), "reified parameter");
    EXPECT_EQ(drain(*result.value().cursor), (std::vector<int64_t>{0, 1}));
}

TEST(CollectionInferencerTest, EmptyTypedCollectionSucceeds) {
    std::vector<User> users;

    auto result = CollectionInferencer::infer(ErasedSequence::of(users));
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(*result.value().element_type, typeid(User));
    EXPECT_TRUE(drain(*result.value().cursor).empty());
}

TEST(CollectionInferencerTest, SequenceCapabilitySecond) {
    std::array<User, 2> users{make_user(7, "A", "B"), make_user(8, "C", "D")};

    auto result = CollectionInferencer::infer(ErasedSequence::of(users));
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(*result.value().element_type, typeid(User));
    EXPECT_EQ(result.value().source, ElementTypeSource::SEQUENCE_CAPABILITY);
    EXPECT_EQ(drain(*result.value().cursor), (std::vector<int64_t>{7, 8}));
}

TEST(CollectionInferencerTest, CapabilityDoesNotWalkTheRange) {
    CountingUserRange users(make_users(3));

    auto result = CollectionInferencer::infer(ErasedSequence::of(users));
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(result.value().source, ElementTypeSource::SEQUENCE_CAPABILITY);
    EXPECT_EQ(users.begins(), 0);
}

TEST(CollectionInferencerTest, FirstNonEmptyElementLast) {
    std::vector<std::any> items{std::any(), std::any(), std::any(make_user(3, "A", "B")),
                                std::any(make_user(4, "C", "D"))};

    auto result = CollectionInferencer::infer(ErasedSequence::of(items));
    ASSERT_RESULT_OK(result);
    EXPECT_EQ(*result.value().element_type, typeid(User));
    EXPECT_EQ(result.value().source, ElementTypeSource::FIRST_ELEMENT);
    EXPECT_EQ(source_name(ElementTypeSource::FIRST_ELEMENT), "first element");
}

TEST(CollectionInferencerTest, ScannedElementIsReplayed) {
    std::vector<std::any> items{std::any(), std::any(make_user(3, "A", "B")), std::any(),
                                std::any(make_user(4, "C", "D"))};

    auto result = CollectionInferencer::infer(ErasedSequence::of(items));
    ASSERT_RESULT_OK(result);

    // The skipped leading absent element is not replayed; the found one is
    auto& cursor = *result.value().cursor;
    std::any element;
    ASSERT_TRUE(cursor.next(element));
    ASSERT_EQ(element.type(), typeid(User));
    EXPECT_EQ(std::any_cast<const User&>(element).id, 3);

    ASSERT_TRUE(cursor.next(element));
    EXPECT_FALSE(element.has_value());

    ASSERT_TRUE(cursor.next(element));
    EXPECT_EQ(std::any_cast<const User&>(element).id, 4);

    EXPECT_FALSE(cursor.next(element));
}

TEST(CollectionInferencerTest, EmptyUntypedCollectionFails) {
    std::vector<std::any> items;

    auto result = CollectionInferencer::infer(ErasedSequence::of(items));
    ASSERT_RESULT_ERROR_CODE(result, ErrorCode::TYPE_INFERENCE_FAILED);
    EXPECT_NE(result.message().find("vector<any"), std::string::npos);
}

TEST(CollectionInferencerTest, AllEmptyElementsFails) {
    std::vector<std::any> items(3);

    auto result = CollectionInferencer::infer(ErasedSequence::of(items));
    ASSERT_RESULT_ERROR_CODE(result, ErrorCode::TYPE_INFERENCE_FAILED);
    EXPECT_NE(result.message().find("holds no non-null element"), std::string::npos);
}
