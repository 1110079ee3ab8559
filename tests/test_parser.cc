/**
 * @file test_parser.cc
 * @brief Tests for reading UVL text into a FeatureModel
 */

#include "ModelErrors.hh"
#include "uvl2cnf/UVL2CNF.hh"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

std::shared_ptr<FeatureModel> parse(const std::string& text) {
    uvl2cnf::UVL2CNF converter;
    return converter.parse(text);
}

const std::string CAR_MODEL =
    "namespace Cars\n"
    "\n"
    "features\n"
    "    Car\n"
    "        mandatory\n"
    "            Engine\n"
    "        optional\n"
    "            GPS\n"
    "        alternative\n"
    "            Manual\n"
    "            Automatic\n"
    "\n"
    "constraints\n"
    "    GPS => Automatic\n";

} // namespace

// ============================================================================
// Feature tree
// ============================================================================

TEST(Parser, ReadsNamespace) {
    auto model = parse(CAR_MODEL);
    EXPECT_EQ(model->get_namespace(), "Cars");
}

TEST(Parser, FeaturesInBreadthFirstOrder) {
    auto model = parse(CAR_MODEL);
    std::vector<std::string> expected = {"Car", "Engine", "GPS", "Manual", "Automatic"};
    EXPECT_EQ(model->get_feature_names(), expected);
    EXPECT_EQ(model->get_root()->get_name(), "Car");
}

TEST(Parser, BreadthFirstOrderAcrossLevels) {
    auto model = parse(
        "features\n"
        "    R\n"
        "        optional\n"
        "            A\n"
        "                mandatory\n"
        "                    A1\n"
        "            B\n"
        "                optional\n"
        "                    B1\n");
    std::vector<std::string> expected = {"R", "A", "B", "A1", "B1"};
    EXPECT_EQ(model->get_feature_names(), expected);
    EXPECT_EQ(model->index_of("A1"), 3u);
    EXPECT_EQ(model->depth_of("R"), 0u);
    EXPECT_EQ(model->depth_of("B1"), 2u);
}

TEST(Parser, RelationsFollowGroups) {
    auto model = parse(CAR_MODEL);
    auto car = model->get_feature("Car");
    ASSERT_EQ(car->get_relations().size(), 3u);
    EXPECT_EQ(car->get_relations()[0]->get_type(), Relation::Type::MANDATORY);
    EXPECT_EQ(car->get_relations()[1]->get_type(), Relation::Type::OPTIONAL);
    EXPECT_EQ(car->get_relations()[2]->get_type(), Relation::Type::ALTERNATIVE);
    EXPECT_EQ(car->get_relations()[2]->get_children().size(), 2u);
    EXPECT_TRUE(model->get_feature("GPS")->is_leaf());
    EXPECT_FALSE(car->is_leaf());
    EXPECT_EQ(model->get_feature("Manual")->get_parent(), car);
}

TEST(Parser, OptionalGroupMakesOneRelationPerChild) {
    auto model = parse(
        "features\n"
        "    R\n"
        "        optional\n"
        "            A\n"
        "            B\n");
    EXPECT_EQ(model->get_relations().size(), 2u);
    for (const auto& relation : model->get_relations()) {
        EXPECT_TRUE(relation->is_optional());
    }
}

TEST(Parser, GroupCardinality) {
    auto model = parse(
        "features\n"
        "    R\n"
        "        [1..2]\n"
        "            A\n"
        "            B\n"
        "            C\n");
    ASSERT_EQ(model->get_relations().size(), 1u);
    auto relation = model->get_relations()[0];
    EXPECT_EQ(relation->get_type(), Relation::Type::CARDINALITY);
    EXPECT_EQ(relation->get_card_min(), 1);
    EXPECT_EQ(relation->get_card_max(), 2);
}

TEST(Parser, CardinalityOneToAllIsOrGroup) {
    auto model = parse(
        "features\n"
        "    R\n"
        "        [1..*]\n"
        "            A\n"
        "            B\n");
    ASSERT_EQ(model->get_relations().size(), 1u);
    EXPECT_EQ(model->get_relations()[0]->get_type(), Relation::Type::OR);
}

TEST(Parser, AbstractAttribute) {
    auto model = parse(
        "features\n"
        "    R {abstract}\n"
        "        optional\n"
        "            A\n");
    EXPECT_TRUE(model->get_feature("R")->is_abstract());
    EXPECT_FALSE(model->get_feature("A")->is_abstract());
}

TEST(Parser, QuotedNamesKeepQuotes) {
    auto model = parse(
        "features\n"
        "    \"My Root\"\n"
        "        optional\n"
        "            \"Extra Part\"\n"
        "constraints\n"
        "    \"Extra Part\" => \"My Root\"\n");
    EXPECT_TRUE(model->has_feature("\"My Root\""));
    EXPECT_TRUE(model->has_feature("\"Extra Part\""));
    EXPECT_EQ(model->get_constraints().size(), 1u);
}

TEST(Parser, CommentsAndBlankLinesIgnored) {
    auto model = parse(
        "// a small model\n"
        "features\n"
        "    R\n"
        "\n"
        "        optional // trailing comment\n"
        "            A\n"
        "\n");
    EXPECT_EQ(model->get_features().size(), 2u);
}

TEST(Parser, TabsIndentLikeFourSpaces) {
    auto model = parse(
        "features\n"
        "\tR\n"
        "\t\toptional\n"
        "\t\t\tA\n");
    EXPECT_EQ(model->get_features().size(), 2u);
}

// ============================================================================
// Constraints
// ============================================================================

TEST(Parser, ConstraintsAreRead) {
    auto model = parse(CAR_MODEL);
    ASSERT_EQ(model->get_constraints().size(), 1u);
    EXPECT_EQ(model->get_num_filtered_constraints(), 0);
}

TEST(Parser, ArithmeticConstraintsAreFiltered) {
    auto model = parse(
        "features\n"
        "    R\n"
        "        optional\n"
        "            A\n"
        "            B\n"
        "constraints\n"
        "    A => B\n"
        "    A + B > 1\n");
    EXPECT_EQ(model->get_constraints().size(), 1u);
    EXPECT_EQ(model->get_num_filtered_constraints(), 1);
}

// ============================================================================
// Lookups
// ============================================================================

TEST(Parser, UnknownFeatureLookup) {
    auto model = parse(CAR_MODEL);
    EXPECT_EQ(model->find_feature("Wings"), nullptr);
    EXPECT_THROW(model->get_feature("Wings"), UnknownFeatureError);
    EXPECT_THROW(model->index_of("Wings"), UnknownFeatureError);
}

// ============================================================================
// Malformed models
// ============================================================================

TEST(Parser, SyntaxErrorIsMalformed) {
    EXPECT_THROW(parse("features\n    R\n        optional\n            A =>\n"), MalformedModelError);
}

TEST(Parser, EmptyTextIsMalformed) {
    EXPECT_THROW(parse(""), MalformedModelError);
}

TEST(Parser, DuplicateFeatureIsMalformed) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        optional\n"
            "            A\n"
            "            A\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("feature 'A' is already declared at line 4"), std::string::npos) << message;
        EXPECT_EQ(e.get_line(), 5u);
    }
}

TEST(Parser, UndefinedConstraintFeatureIsMalformed) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        optional\n"
            "            A\n"
            "constraints\n"
            "    A => Missing\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("references undefined feature 'Missing'"), std::string::npos) << message;
    }
}

TEST(Parser, MessagesCarryPrefix) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        optional\n"
            "            R\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("The UVL model is malformed: Line 4:", 0), 0u) << e.what();
    }
}

TEST(Parser, SecondRootIsMalformed) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        optional\n"
            "            A\n"
            "    S\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("feature 'S' is a second root"), std::string::npos) << message;
        EXPECT_EQ(e.get_line(), 5u);
        EXPECT_EQ(e.get_column(), 4u);
    }
}

TEST(Parser, InconsistentDedentIsMalformed) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        optional\n"
            "            A\n"
            "          B\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("inconsistent indentation"), std::string::npos) << message;
        EXPECT_EQ(e.get_line(), 5u);
        EXPECT_EQ(e.get_column(), 10u);
    }
}

TEST(Parser, ImportsAreRejected) {
    try {
        parse(
            "imports\n"
            "    lib.Engine as engine\n"
            "features\n"
            "    R\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("imports are not supported"), std::string::npos) << message;
        EXPECT_EQ(e.get_line(), 1u);
    }
}

TEST(Parser, OversizedCardinalityCarriesLocation) {
    try {
        parse(
            "features\n"
            "    R\n"
            "        [1..99999999999]\n"
            "            A\n");
        FAIL() << "expected MalformedModelError";
    } catch (const MalformedModelError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("is out of range"), std::string::npos) << message;
        EXPECT_EQ(e.get_line(), 3u);
        EXPECT_EQ(e.get_column(), 8u);
    }
}
