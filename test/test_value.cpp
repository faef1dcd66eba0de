#include <gtest/gtest.h>

#include <kvorm/core/Value.h>
#include <kvorm/core/serialize.h>
#include <kvorm/fmt_support.h>

using namespace kvorm;

TEST(Value, DefaultIsNil) {
    Value v;
    EXPECT_TRUE(v.is_nil());
    EXPECT_TRUE(v == nil);
    EXPECT_EQ(v.type_name(), "nil");
}

TEST(Value, ScalarTypes) {
    EXPECT_EQ(Value{true}.type(), Value::BOOL);
    EXPECT_EQ(Value{-7}.type(), Value::INT);
    EXPECT_EQ(Value{7UL}.type(), Value::UINT);
    EXPECT_EQ(Value{3.5}.type(), Value::FLOAT);
    EXPECT_EQ(Value{"tea"}.type(), Value::STR);
    EXPECT_EQ(Value{Record{}}.type(), Value::MAP);
}

TEST(Value, StrictEquality) {
    EXPECT_EQ(Value{1}, Value{1});
    EXPECT_NE(Value{1}, Value{1UL});
    EXPECT_NE(Value{1}, Value{1.0});
    EXPECT_NE(Value{1}, Value{"1"});
    EXPECT_NE(Value{1}, Value{true});
    EXPECT_NE(Value{0}, Value{});
    EXPECT_NE(Value{""}, Value{});
    EXPECT_EQ(Value{"x"}, Value{String{"x"}});
}

TEST(Value, MapEqualityIsOrderSensitive) {
    Record a;
    a["x"] = 1;
    a["y"] = 2;
    Record b;
    b["y"] = 2;
    b["x"] = 1;
    Record c;
    c["x"] = 1;
    c["y"] = 2;
    EXPECT_NE(Value{a}, Value{b});
    EXPECT_EQ(Value{a}, Value{c});
    EXPECT_TRUE(identical(a, c));
    EXPECT_FALSE(identical(a, b));
}

TEST(Value, WrongType) {
    Value v{"tea"};
    EXPECT_THROW(v.as_int(), WrongType);
    EXPECT_THROW(v.as_map(), WrongType);
    EXPECT_EQ(v.as_str(), "tea");
}

TEST(Value, CopyIsDeep) {
    Record r;
    r["x"] = "one";
    Value a{r};
    Value b = a;
    b.as_map()["x"] = "two";
    EXPECT_EQ(a.get("x"), Value{"one"});
    EXPECT_EQ(b.get("x"), Value{"two"});
}

TEST(Value, Move) {
    Value a{"tea"};
    Value b{std::move(a)};
    EXPECT_TRUE(a.is_nil());
    EXPECT_EQ(b, Value{"tea"});
}

TEST(Value, MapAccess) {
    Record r;
    r["x"] = 1;
    Value v{r};
    EXPECT_TRUE(v.contains("x"));
    EXPECT_FALSE(v.contains("y"));
    EXPECT_TRUE(v.get("y").is_nil());
    EXPECT_EQ(v.size(), 1UL);
    EXPECT_TRUE(Value{7}.get("x").is_nil());
}

TEST(Value, ToStr) {
    EXPECT_EQ(Value{}.to_str(), "nil");
    EXPECT_EQ(Value{true}.to_str(), "true");
    EXPECT_EQ(Value{-7}.to_str(), "-7");
    EXPECT_EQ(Value{7UL}.to_str(), "7");
    EXPECT_EQ(Value{1.0}.to_str(), "1.0");
    EXPECT_EQ(Value{0.1}.to_str(), "0.1");
    EXPECT_EQ(Value{"tea"}.to_str(), "tea");
}

TEST(Value, ToJson) {
    Record inner;
    inner["city"] = "Paris";
    Record r;
    r["name"] = "Ann \"A\"";
    r["age"] = 37;
    r["address"] = inner;
    r["note"] = nil;
    EXPECT_EQ(Value{r}.to_json(), R"({"name": "Ann \"A\"", "age": 37, "address": {"city": "Paris"}, "note": null})");
}

TEST(Value, Merge) {
    Record base;
    base["a"] = 1;
    base["b"] = 2;
    Record changes;
    changes["b"] = 3;
    changes["c"] = 4;
    auto result = merge(base, changes);
    EXPECT_EQ(Value{result}.to_json(), R"({"a": 1, "b": 3, "c": 4})");
    EXPECT_EQ(Value{base}.to_json(), R"({"a": 1, "b": 2})");
}

TEST(Value, Format) {
    EXPECT_EQ(fmt::format("{}", Value{42}), "42");
    EXPECT_EQ(fmt::format("{}", Value{"x"}), "x");
}

TEST(Serialize, TypeTagged) {
    EXPECT_EQ(serialize(Value{}), "0");
    EXPECT_EQ(serialize(Value{false}), "1");
    EXPECT_EQ(serialize(Value{true}), "2");
    EXPECT_EQ(serialize(Value{1}), "31");
    EXPECT_EQ(serialize(Value{1UL}), "41");
    EXPECT_EQ(serialize(Value{1.0}), "51.0");
    EXPECT_EQ(serialize(Value{"1"}), "61");
}

TEST(Serialize, Deserialize) {
    Value v;
    ASSERT_TRUE(deserialize("3-7", v));
    EXPECT_EQ(v, Value{-7});
    ASSERT_TRUE(deserialize("47", v));
    EXPECT_EQ(v, Value{7UL});
    ASSERT_TRUE(deserialize("53.1415926", v));
    EXPECT_EQ(v, Value{3.1415926});
    ASSERT_TRUE(deserialize("6tea", v));
    EXPECT_EQ(v, Value{"tea"});
    ASSERT_TRUE(deserialize("7{'x': 1}", v));
    EXPECT_EQ(v.get("x"), Value{1});
    EXPECT_FALSE(deserialize("", v));
    EXPECT_FALSE(deserialize("9", v));
}
