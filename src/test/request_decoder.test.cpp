//src/test/request_decoder.test.cpp
#include "gtest/gtest.h"
#include "test_support.h"

#include "services/api/RequestDecoder.hpp"

using lsdb::AttributeMap;
using lsdb::ErrorKind;
using lsdb::ParamMap;

TEST(RequestDecoder, RequireParameter) {
    ParamMap params = {{"DomainName", "books"}};
    EXPECT_EQ(lsdb::requireParameter(params, "DomainName"), "books");
    try {
        lsdb::requireParameter(params, "ItemName");
        FAIL() << "expected MissingParameter";
    } catch (const lsdb::SdbError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingParameter);
        EXPECT_STREQ(e.what(), "The request must contain the parameter ItemName.");
    }
}

TEST(RequestDecoder, AttributesFromZeroUntilGap) {
    ParamMap params = {
        {"Attribute.0.Name", "color"}, {"Attribute.0.Value", "red"},
        {"Attribute.1.Name", "size"},  {"Attribute.1.Value", "large"},
        {"Attribute.3.Name", "lost"},  {"Attribute.3.Value", "after gap"},
    };
    EXPECT_EQ(lsdb::decodeAttributes(params), (AttributeMap{{"color", "red"}, {"size", "large"}}));
}

TEST(RequestDecoder, AttributesFromOne) {
    ParamMap params = {
        {"Attribute.1.Name", "color"}, {"Attribute.1.Value", "red"},
        {"Attribute.2.Name", "size"},  {"Attribute.2.Value", "large"},
        {"Attribute.2.Replace", "true"},
    };
    EXPECT_EQ(lsdb::decodeAttributes(params), (AttributeMap{{"color", "red"}, {"size", "large"}}));
}

TEST(RequestDecoder, NoAttributes) {
    EXPECT_TRUE(lsdb::decodeAttributes(ParamMap{{"DomainName", "books"}}).empty());
}

TEST(RequestDecoder, LaterIndexWinsForRepeatedName) {
    ParamMap params = {
        {"Attribute.0.Name", "color"}, {"Attribute.0.Value", "red"},
        {"Attribute.1.Name", "color"}, {"Attribute.1.Value", "blue"},
    };
    EXPECT_EQ(lsdb::decodeAttributes(params), (AttributeMap{{"color", "blue"}}));
}

TEST(RequestDecoder, NameWithoutValueIsMissingParameter) {
    ParamMap params = {{"Attribute.0.Name", "color"}};
    EXPECT_EQ(faultKind([&] { lsdb::decodeAttributes(params); }), ErrorKind::MissingParameter);
}

TEST(RequestDecoder, AttributeNamesWithoutValues) {
    ParamMap params = {
        {"Attribute.1.Name", "color"},
        {"Attribute.2.Name", "size"}, {"Attribute.2.Value", "large"},
        {"Attribute.3.Name", "shape"},
    };
    EXPECT_EQ(lsdb::decodeAttributeNames(params), (std::vector<std::string>{"color", "size", "shape"}));
    EXPECT_TRUE(lsdb::decodeAttributeNames(ParamMap{{"ItemName", "a"}}).empty());
}

TEST(RequestDecoder, EmptyValueIsKept) {
    ParamMap params = {{"Attribute.0.Name", "note"}, {"Attribute.0.Value", ""}};
    EXPECT_EQ(lsdb::decodeAttributes(params), (AttributeMap{{"note", ""}}));
}

TEST(RequestDecoder, BatchItems) {
    ParamMap params = {
        {"Item.0.ItemName", "a"},
        {"Item.0.Attribute.0.Name", "x"}, {"Item.0.Attribute.0.Value", "1"},
        {"Item.0.Attribute.1.Name", "y"}, {"Item.0.Attribute.1.Value", "2"},
        {"Item.1.ItemName", "b"},
        {"Item.1.Attribute.1.Name", "z"}, {"Item.1.Attribute.1.Value", "3"},
        {"Item.3.ItemName", "skipped"},
    };
    auto items = lsdb::decodeBatchItems(params);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].itemName, "a");
    EXPECT_EQ(items[0].attributes, (AttributeMap{{"x", "1"}, {"y", "2"}}));
    EXPECT_EQ(items[1].itemName, "b");
    EXPECT_EQ(items[1].attributes, (AttributeMap{{"z", "3"}}));
}

TEST(RequestDecoder, BatchItemsFromOneDoNotMixWithTopLevel) {
    ParamMap params = {
        {"Attribute.0.Name", "top"}, {"Attribute.0.Value", "level"},
        {"Item.1.ItemName", "only"},
        {"Item.1.Attribute.1.Name", "k"}, {"Item.1.Attribute.1.Value", "v"},
    };
    auto items = lsdb::decodeBatchItems(params);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].attributes, (AttributeMap{{"k", "v"}}));
}
