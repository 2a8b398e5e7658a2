#include "structure.hpp"
#include <gtest/gtest.h>
#include <algorithm>

static const char* kDoc =
  "# Intro\n"
  "Some intro text.\n"
  "More intro text.\n"
  "\n"
  "## Details\n"
  "- first item\n"
  "- second item\n"
  "\n"
  "| a | b |\n"
  "| 1 | 2 |\n"
  "\n"
  "```code\n"
  "x = 1\n"
  "```\n"
  "# Second\n"
  "Closing words.\n";

class StructureTest : public ::testing::Test {
protected:
  StructureParser parser;
};

// ============================================================ parse

TEST_F(StructureTest, EmptyInput) {
  EXPECT_TRUE(parser.parse("").empty());
  EXPECT_TRUE(parser.parse("   \n\n\t\n").empty());
}

TEST_F(StructureTest, ClassifiesAndGroups) {
  auto s = parser.parse(kDoc);
  ASSERT_EQ(s.nodes.size(), 8u);

  EXPECT_EQ(s.nodes[0].type, NodeType::Heading);
  EXPECT_EQ(s.nodes[0].level, 1);
  EXPECT_EQ(s.nodes[0].content, "Intro");

  EXPECT_EQ(s.nodes[1].type, NodeType::Paragraph);
  EXPECT_EQ(s.nodes[1].content, "Some intro text. More intro text.");

  EXPECT_EQ(s.nodes[2].type, NodeType::Heading);
  EXPECT_EQ(s.nodes[2].level, 2);

  EXPECT_EQ(s.nodes[3].type, NodeType::List);
  EXPECT_EQ(s.nodes[3].content, "• first item\n• second item");

  EXPECT_EQ(s.nodes[4].type, NodeType::Table);
  EXPECT_EQ(s.nodes[4].content, "| a | b |\n| 1 | 2 |");

  EXPECT_EQ(s.nodes[5].type, NodeType::Code);
  EXPECT_EQ(s.nodes[5].content, "x = 1");

  EXPECT_EQ(s.nodes[6].content, "Second");
  EXPECT_EQ(s.nodes[7].content, "Closing words.");
}

TEST_F(StructureTest, ParentsAndPaths) {
  auto s = parser.parse(kDoc);
  ASSERT_EQ(s.root_nodes.size(), 2u);
  EXPECT_EQ(s.root_nodes[0], 0u);
  EXPECT_EQ(s.root_nodes[1], 6u);

  EXPECT_EQ(s.nodes[0].children, (std::vector<size_t>{1, 2}));
  EXPECT_EQ(s.nodes[2].children, (std::vector<size_t>{3, 4, 5}));
  EXPECT_EQ(s.nodes[3].path, (std::vector<std::string>{"Intro", "Details"}));
  EXPECT_FALSE(s.nodes[6].parent.has_value());
  EXPECT_EQ(s.nodes[7].path, (std::vector<std::string>{"Second"}));

  EXPECT_EQ(s.heading_paths.at("node_3"), (std::vector<std::string>{"Intro", "Details"}));
  EXPECT_EQ(s.heading_paths.at("node_1"), (std::vector<std::string>{"Intro"}));
}

TEST_F(StructureTest, Invariants) {
  auto s = parser.parse(kDoc);
  for (size_t i = 0; i < s.nodes.size(); ++i) {
    const auto& n = s.nodes[i];
    EXPECT_EQ(n.position, (int)i);
    EXPECT_EQ(n.id, "node_" + std::to_string(i + 1));
    ASSERT_NE(s.find(n.id), nullptr);
    EXPECT_EQ(s.find(n.id), &s.nodes[i]);
    if (n.parent) {
      EXPECT_LT(*n.parent, i);
      const auto& kids = s.nodes[*n.parent].children;
      EXPECT_NE(std::find(kids.begin(), kids.end(), i), kids.end());
    }
    for (size_t c : n.children) {
      ASSERT_TRUE(s.nodes[c].parent.has_value());
      EXPECT_EQ(*s.nodes[c].parent, i);
    }
  }
  EXPECT_EQ(s.find("node_99"), nullptr);
}

TEST_F(StructureTest, NumberedHeadings) {
  auto s = parser.parse("1. Introduction\n3 apples are red.\n2.1 Scope\n1. Buy milk.\n");
  ASSERT_EQ(s.nodes.size(), 4u);
  EXPECT_EQ(s.nodes[0].type, NodeType::Heading);
  EXPECT_EQ(s.nodes[0].level, 1);
  EXPECT_EQ(s.nodes[0].content, "1. Introduction");
  EXPECT_EQ(s.nodes[1].type, NodeType::Paragraph);   // a sentence, not a title
  EXPECT_EQ(s.nodes[2].type, NodeType::Heading);
  EXPECT_EQ(s.nodes[2].level, 2);
  EXPECT_EQ(s.nodes[3].type, NodeType::List);
  EXPECT_EQ(s.nodes[3].path, (std::vector<std::string>{"1. Introduction", "2.1 Scope"}));
}

TEST_F(StructureTest, SiblingHeadingClosesSection) {
  auto s = parser.parse("# A\n## A1\ntext one\n## A2\ntext two\n");
  ASSERT_EQ(s.nodes.size(), 5u);
  ASSERT_TRUE(s.nodes[3].parent.has_value());
  EXPECT_EQ(*s.nodes[3].parent, 0u);
  EXPECT_EQ(s.nodes[4].path, (std::vector<std::string>{"A", "A2"}));
}

TEST_F(StructureTest, CodeVariants) {
  auto s = parser.parse("Intro line\n    indented code\n`inline()`\n```one liner```\n");
  ASSERT_EQ(s.nodes.size(), 4u);
  EXPECT_EQ(s.nodes[0].type, NodeType::Paragraph);
  EXPECT_EQ(s.nodes[1].type, NodeType::Code);
  EXPECT_EQ(s.nodes[2].type, NodeType::Code);
  EXPECT_EQ(s.nodes[3].type, NodeType::Code);
  EXPECT_EQ(s.nodes[3].content, "```one liner```");
}

TEST_F(StructureTest, UnterminatedFenceStillBecomesCode) {
  auto s = parser.parse("```\nint main() {}\n");
  ASSERT_EQ(s.nodes.size(), 1u);
  EXPECT_EQ(s.nodes[0].type, NodeType::Code);
  EXPECT_EQ(s.nodes[0].content, "int main() {}");
}

// ============================================================ helpers

TEST_F(StructureTest, NodesUnderHeadingIsBreadthFirst) {
  auto s = parser.parse(kDoc);
  auto under = nodes_under_heading(s, "node_1");
  std::vector<int> positions;
  for (auto* n : under) positions.push_back(n->position);
  EXPECT_EQ(positions, (std::vector<int>{1, 2, 3, 4, 5}));
  EXPECT_TRUE(nodes_under_heading(s, "missing").empty());
}

TEST_F(StructureTest, HeadingsAtLevel) {
  auto s = parser.parse(kDoc);
  EXPECT_EQ(headings_at_level(s, 1).size(), 2u);
  EXPECT_EQ(headings_at_level(s, 2).size(), 1u);
  EXPECT_TRUE(headings_at_level(s, 3).empty());
}

TEST_F(StructureTest, RenderedTextParsesBack) {
  const char* doc =
    "# Intro\nSome intro text.\n\n## Details\n- first item\n- second item\n\n| a | b |\n| 1 | 2 |\n# Second\nClosing words.\n";
  auto first = parser.parse(doc);
  auto second = parser.parse(structure_to_text(first));
  ASSERT_EQ(first.nodes.size(), second.nodes.size());
  for (size_t i = 0; i < first.nodes.size(); ++i) {
    EXPECT_EQ(first.nodes[i].type, second.nodes[i].type) << i;
    EXPECT_EQ(first.nodes[i].content, second.nodes[i].content) << i;
    EXPECT_EQ(first.nodes[i].level, second.nodes[i].level) << i;
    EXPECT_EQ(first.nodes[i].path, second.nodes[i].path) << i;
  }
}
