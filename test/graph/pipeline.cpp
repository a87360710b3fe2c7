#include "pipesplit/pipeline/Pipeline.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <type_traits>

using namespace pipesplit::pipeline;

TEST(pipeline, add_keeps_sources_in_order) {
  Pipeline p;
  Stage &a = p.add("a");
  Stage &b = p.add("b");
  Stage &zip = p.add("zip", {&b, &a});

  EXPECT_EQ(p.size(), 3u);
  EXPECT_EQ(zip.kind(), StageKind::Generic);
  ASSERT_EQ(zip.sources().size(), 2u);
  EXPECT_EQ(zip.sources()[0], &b);
  EXPECT_EQ(zip.sources()[1], &a);
  EXPECT_TRUE(a.sources().empty());
}

TEST(pipeline, equal_stages_are_distinct) {
  Pipeline p;
  Stage &x = p.add(StageKind::RoundRobinDispatch, "x");
  Stage &y = p.add(StageKind::RoundRobinDispatch, "x");
  EXPECT_NE(&x, &y);
  EXPECT_EQ(x.name(), y.name());
}

TEST(pipeline, connect_can_close_a_cycle) {
  Pipeline p;
  Stage &a = p.add("a");
  Stage &b = p.add("b", {&a});
  p.connect(a, b);

  ASSERT_EQ(a.sources().size(), 1u);
  EXPECT_EQ(a.sources()[0], &b);
  ASSERT_EQ(b.sources().size(), 1u);
  EXPECT_EQ(b.sources()[0], &a);
}

TEST(pipeline, rejects_foreign_and_null_sources) {
  Pipeline p;
  Pipeline other;
  Stage &foreign = other.add("foreign");
  Stage &a = p.add("a");

  EXPECT_THROW(p.add("b", {&foreign}), std::invalid_argument);
  EXPECT_THROW(p.add("c", {nullptr}), std::invalid_argument);
  EXPECT_THROW(p.connect(a, foreign), std::invalid_argument);
  EXPECT_EQ(p.size(), 1u);
}

TEST(pipeline, stages_survive_moving_the_pipeline) {
  Pipeline p;
  Stage &a = p.add("a");
  Stage &b = p.add("b", {&a});

  Pipeline moved = std::move(p);
  EXPECT_EQ(moved.size(), 2u);
  EXPECT_EQ(b.sources()[0], &a);
  EXPECT_NO_THROW(moved.add("c", {&b}));
}

TEST(pipeline, stages_are_only_created_by_the_pipeline) {
  static_assert(
      !std::is_constructible_v<Stage, StageKind, pipesplit::memory::string>);
  static_assert(!std::is_copy_constructible_v<Stage>);
  static_assert(!std::is_move_constructible_v<Stage>);
  static_assert(!std::has_virtual_destructor_v<Stage>);

  Pipeline p;
  Stage &ph = p.add(StageKind::Placeholder, "ph");
  EXPECT_EQ(ph.kind(), StageKind::Placeholder);
  EXPECT_EQ(ph.name(), "ph");
  EXPECT_TRUE(ph.sources().empty());
}
